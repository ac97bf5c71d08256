/**
 * @file collision_mesh.hpp
 * @brief Bounding quad of a body's shapes, used for every collision query
 *
 * The mesh is the axis-aligned rectangle, in the body's local frame, that
 * bounds every vertex of every shape group attached to the body. It is
 * computed on the first query and kept until reset() is called; shapes
 * added after the first query are not picked up until then.
 */

#pragma once

#include <array>
#include <optional>

#include "planar/math/polygon.hpp"
#include "planar/math/shape_group.hpp"

namespace Components {

/**
 * @brief Collision mesh placed in the world
 */
struct WorldMesh {
    Vector center;                ///< The body position
    std::array<Vector, 4> shape;  ///< Transformed corners, same order as the local quad

    Polygon polygon() const { return Polygon(shape.begin(), shape.end()); }
};

class CollisionMesh {
public:
    using Quad = std::array<Vector, 4>;

    CollisionMesh() = default;
    explicit CollisionMesh(ShapeGroup shape);

    /**
     * @brief Attaches another group to the body's shape
     *
     * Does not clear a quad that was already computed.
     */
    void addShape(const ShapeGroup& group, const ShapeRelation& relation = ShapeRelation());

    /**
     * @brief Attaches an axis-aligned rectangle centered at offset
     */
    void addRect(double width, double height, const Vector& offset = Vector());

    /**
     * @brief Local bounding quad: (left, top), (right, top), (right, bottom), (left, bottom)
     *
     * Top is the largest y. Memoized.
     *
     * @throws Errors::PreconditionViolation if no shape has any vertex
     */
    const Quad& local() const;

    /**
     * @brief Local quad rotated by angle, scaled, then moved to position
     */
    WorldMesh world(const Vector& position, double angle, double scale) const;

    /** @brief Drops the memoized quad so the next query recomputes it */
    void reset() { quad.reset(); }

    bool isComputed() const { return quad.has_value(); }

private:
    ShapeGroup shape;
    mutable std::optional<Quad> quad;
};

} // namespace Components
