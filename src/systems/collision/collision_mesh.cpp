#include "planar/systems/collision/collision_mesh.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "planar/core/errors.hpp"

namespace Components {

CollisionMesh::CollisionMesh(ShapeGroup shape) : shape(std::move(shape)) {}

void CollisionMesh::addShape(const ShapeGroup& group, const ShapeRelation& relation) {
    shape.addGroup(group, relation);
}

void CollisionMesh::addRect(double width, double height, const Vector& offset) {
    shape.addGroup(ShapeGroup(rectPrimitive(offset, width, height, true)));
}

const CollisionMesh::Quad& CollisionMesh::local() const {
    if (quad) {
        return *quad;
    }

    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    bool any = false;

    for (const auto& group : shape.computeVertexGroups()) {
        for (const auto& v : group.vertices) {
            minX = std::min(minX, v.x);
            maxX = std::max(maxX, v.x);
            minY = std::min(minY, v.y);
            maxY = std::max(maxY, v.y);
            any = true;
        }
    }
    if (!any) {
        throw Errors::PreconditionViolation("CollisionMesh::local() on a body without shape vertices");
    }

    quad = Quad{Vector(minX, maxY), Vector(maxX, maxY), Vector(maxX, minY), Vector(minX, minY)};
    return *quad;
}

WorldMesh CollisionMesh::world(const Vector& position, double angle, double scale) const {
    const Quad& corners = local();
    WorldMesh mesh;
    mesh.center = position;
    for (size_t i = 0; i < corners.size(); ++i) {
        mesh.shape[i] = transformPoint(corners[i], position, angle, scale);
    }
    return mesh;
}

} // namespace Components
