#include "planar/math/shape_group.hpp"

ShapeGroup::ShapeGroup(Polygon vertices, Components::Color color)
    : vertices(std::move(vertices)), color(color) {}

void ShapeGroup::addGroup(const ShapeGroup& child, const ShapeRelation& relation) {
    children.emplace_back(child, relation);
    flattened.reset();
}

ShapeGroup ShapeGroup::withVertices(Polygon newVertices, bool withChildren) const {
    ShapeGroup copy(std::move(newVertices), color);
    if (withChildren) {
        copy.children = children;
    }
    return copy;
}

ShapeGroup ShapeGroup::flipOnX(bool withChildren) const {
    Polygon mirrored;
    mirrored.reserve(vertices.size());
    for (const auto& v : vertices) {
        mirrored.emplace_back(v.x, -v.y);
    }
    return withVertices(std::move(mirrored), withChildren);
}

ShapeGroup ShapeGroup::flipOnY(bool withChildren) const {
    Polygon mirrored;
    mirrored.reserve(vertices.size());
    for (const auto& v : vertices) {
        mirrored.emplace_back(-v.x, v.y);
    }
    return withVertices(std::move(mirrored), withChildren);
}

ShapeGroup ShapeGroup::rotateOnCenter(double angle, bool withChildren) const {
    if (vertices.empty()) {
        return withVertices(vertices, withChildren);
    }
    Vector center;
    for (const auto& v : vertices) {
        center += v;
    }
    center = center / static_cast<double>(vertices.size());

    Polygon rotated;
    rotated.reserve(vertices.size());
    for (const auto& v : vertices) {
        rotated.push_back(v.rotate(angle, center));
    }
    return withVertices(std::move(rotated), withChildren);
}

const std::vector<VertexGroup>& ShapeGroup::computeVertexGroups() const {
    if (flattened) {
        return *flattened;
    }

    std::vector<VertexGroup> groups;
    if (!vertices.empty()) {
        groups.push_back({vertices, color});
    }
    for (const auto& [child, relation] : children) {
        for (const auto& group : child.computeVertexGroups()) {
            groups.push_back({transformPolygon(group.vertices, relation.position, relation.angle, relation.scale),
                              group.color});
        }
    }
    flattened = std::move(groups);
    return *flattened;
}

std::vector<VertexGroup> ShapeGroup::applyTransform(const Vector& position,
                                                    double angle,
                                                    double scale,
                                                    bool checkValidity) const
{
    const auto& local = computeVertexGroups();
    std::vector<VertexGroup> world;
    world.reserve(local.size());
    for (const auto& group : local) {
        if (checkValidity) {
            requireValidPolygon(group.vertices, "ShapeGroup::applyTransform");
        }
        world.push_back({transformPolygon(group.vertices, position, angle, scale), group.color});
    }
    return world;
}
