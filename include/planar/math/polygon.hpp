/**
 * @file polygon.hpp
 * @brief Polygon primitive and local-to-world transformation helpers
 *
 * A polygon is an ordered list of vertices; edge i connects vertex i to
 * vertex (i+1) mod N. Storage accepts any polygon, but the collision
 * routines assume convex input.
 */

#ifndef PLANAR_POLYGON_HPP
#define PLANAR_POLYGON_HPP

#include <cmath>
#include <string>
#include <vector>

#include "planar/core/errors.hpp"
#include "planar/math/vector_math.hpp"

using Polygon = std::vector<Vector>;

/**
 * @brief A polygon needs at least 3 vertices to enclose an area
 */
inline bool isValidPolygon(const Polygon &poly) {
    return poly.size() >= 3;
}

/**
 * @brief Throws Errors::InvalidArgument when the polygon is degenerate
 *
 * @param poly Polygon to check
 * @param context Name of the calling routine, used in the message
 */
inline void requireValidPolygon(const Polygon &poly, const char *context) {
    if (!isValidPolygon(poly)) {
        throw Errors::InvalidArgument(std::string(context) + ": polygon needs at least 3 vertices, got "
                                      + std::to_string(poly.size()));
    }
}

/**
 * @brief Transforms a local-space point into the parent frame
 *
 * The order is fixed: rotate about the local origin, then scale, then
 * translate by position.
 */
inline Vector transformPoint(const Vector &local,
                             const Vector &position,
                             double angle,
                             double scale)
{
    double const c = std::cos(angle);
    double const s = std::sin(angle);
    double const rx = local.x*c - local.y*s;
    double const ry = local.x*s + local.y*c;
    return Vector(position.x + rx*scale, position.y + ry*scale);
}

/**
 * @brief Transforms every vertex of a polygon with transformPoint()
 */
inline Polygon transformPolygon(const Polygon &local,
                                const Vector &position,
                                double angle,
                                double scale)
{
    Polygon world;
    world.reserve(local.size());
    for (const auto &v : local) {
        world.push_back(transformPoint(v, position, angle, scale));
    }
    return world;
}

/**
 * @brief Builds an axis-aligned rectangle
 *
 * With fromCenter the rectangle is centered on pos, otherwise pos is its
 * top-left corner and the rectangle extends right and down (y-up).
 * Vertices are ordered top-left, top-right, bottom-right, bottom-left.
 */
inline Polygon rectPrimitive(const Vector &pos, double width, double height, bool fromCenter = false) {
    if (fromCenter) {
        return {
            Vector(pos.x - width / 2, pos.y + height / 2),
            Vector(pos.x + width / 2, pos.y + height / 2),
            Vector(pos.x + width / 2, pos.y - height / 2),
            Vector(pos.x - width / 2, pos.y - height / 2),
        };
    }
    return {
        Vector(pos.x, pos.y),
        Vector(pos.x + width, pos.y),
        Vector(pos.x + width, pos.y - height),
        Vector(pos.x, pos.y - height),
    };
}

#endif
