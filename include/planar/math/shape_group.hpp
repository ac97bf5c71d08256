/**
 * @file shape_group.hpp
 * @brief Hierarchical groups of colored polygons
 *
 * A ShapeGroup is one polygon plus child groups, each attached with a
 * relative position, angle and scale. Flattening the hierarchy gives the
 * list of colored polygons a renderer draws and the vertices a collision
 * mesh bounds.
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "planar/components/basic.hpp"
#include "planar/math/polygon.hpp"

/**
 * @brief Placement of a child group inside its parent frame
 */
struct ShapeRelation {
    Vector position;
    double angle = 0.0;
    double scale = 1.0;
};

/**
 * @brief One flattened polygon with its fill color
 */
struct VertexGroup {
    Polygon vertices;
    Components::Color color;
};

class ShapeGroup {
public:
    ShapeGroup() = default;
    explicit ShapeGroup(Polygon vertices, Components::Color color = Components::Color());

    const Polygon& getVertices() const { return vertices; }
    const Components::Color& getColor() const { return color; }
    size_t childCount() const { return children.size(); }

    /**
     * @brief Attaches a copy of child at the given placement
     *
     * Clears the flattened cache of this group.
     */
    void addGroup(const ShapeGroup& child, const ShapeRelation& relation = ShapeRelation());

    /** @brief Copy mirrored across the x axis (y negated) */
    ShapeGroup flipOnX(bool withChildren = false) const;

    /** @brief Copy mirrored across the y axis (x negated) */
    ShapeGroup flipOnY(bool withChildren = false) const;

    /**
     * @brief Copy rotated about the centroid of its own vertices
     */
    ShapeGroup rotateOnCenter(double angle, bool withChildren = false) const;

    /**
     * @brief Flattens the hierarchy into local-frame polygons
     *
     * The own polygon comes first (when not empty), then each child's groups
     * transformed by its relation. The result is memoized.
     */
    const std::vector<VertexGroup>& computeVertexGroups() const;

    /**
     * @brief Flattened groups placed in the world
     *
     * @param checkValidity Throw Errors::InvalidArgument for any group with
     *        fewer than 3 vertices
     */
    std::vector<VertexGroup> applyTransform(const Vector& position,
                                            double angle,
                                            double scale,
                                            bool checkValidity = false) const;

private:
    ShapeGroup withVertices(Polygon newVertices, bool withChildren) const;

    Polygon vertices;
    Components::Color color;
    std::vector<std::pair<ShapeGroup, ShapeRelation>> children;
    mutable std::optional<std::vector<VertexGroup>> flattened;
};
