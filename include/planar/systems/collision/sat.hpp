/**
 * @file sat.hpp
 * @brief Separating Axis Theorem test for convex polygons
 *
 * Every edge of both polygons is a candidate axis. Vertices are projected
 * with the scalar factor f = (p - edgeStart)·edge / |edge|², so the edge
 * vectors do not need to be normalized. The first separating axis ends the
 * test. When no axis separates the shapes, the axis with the smallest
 * overlap depth gives the minimum translation vector.
 */

#pragma once

#include <optional>

#include "planar/math/polygon.hpp"

namespace Collision {

/**
 * @brief Tests two convex world-space polygons for intersection
 *
 * @param a First polygon, at least 3 vertices
 * @param b Second polygon, at least 3 vertices
 * @return std::nullopt when the polygons are separated, otherwise a vector
 *         whose magnitude is the penetration depth and whose direction is
 *         the separation axis (sign unspecified; the response orients it).
 *         Touching polygons yield the zero vector.
 * @throws Errors::InvalidArgument if either polygon has fewer than 3 vertices
 */
std::optional<Vector> separatingAxisTest(const Polygon& a, const Polygon& b);

} // namespace Collision
