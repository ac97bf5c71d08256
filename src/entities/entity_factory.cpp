#include "planar/entities/entity_factory.hpp"

#include <string>
#include <utility>

#include "planar/core/errors.hpp"

namespace Entities {

entt::entity EntityFactory::createBody(
    entt::registry& registry,
    const Components::Position& position,
    Components::CollisionMesh mesh,
    double angle,
    double scale)
{
    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, position);
    registry.emplace<Components::AngularPosition>(entity, angle);
    registry.emplace<Components::Scale>(entity, scale);
    registry.emplace<Components::CollisionMesh>(entity, std::move(mesh));
    return entity;
}

entt::entity EntityFactory::createRigidBody(
    entt::registry& registry,
    const Components::Position& position,
    Components::CollisionMesh mesh,
    double mass,
    double inertia,
    const Components::Velocity& velocity,
    double angle,
    double scale)
{
    if (!(mass > 0.0)) {
        throw Errors::InvalidArgument("createRigidBody: mass must be positive, got " + std::to_string(mass));
    }
    if (!(inertia > 0.0)) {
        throw Errors::InvalidArgument("createRigidBody: inertia must be positive, got " + std::to_string(inertia));
    }

    auto entity = createBody(registry, position, std::move(mesh), angle, scale);
    registry.emplace<Components::Mass>(entity, mass);
    registry.emplace<Components::Inertia>(entity, inertia);
    registry.emplace<Components::Velocity>(entity, velocity);
    registry.emplace<Components::AngularVelocity>(entity);
    registry.emplace<Components::Acceleration>(entity);
    registry.emplace<Components::AngularAcceleration>(entity);
    registry.emplace<Components::NetForce>(entity);
    return entity;
}

void EntityFactory::setCollisionCallback(
    entt::registry& registry,
    entt::entity entity,
    decltype(Components::CollisionCallback::onCollision) callback)
{
    registry.emplace_or_replace<Components::CollisionCallback>(entity, std::move(callback));
}

void applyForce(entt::registry& registry, entt::entity entity, const Vector& force, double torque) {
    auto* net = registry.try_get<Components::NetForce>(entity);
    if (net == nullptr) {
        throw Errors::InvalidArgument("applyForce on an entity without a NetForce accumulator");
    }
    net->force += force;
    net->torque += torque;
}

double rectangleInertia(double mass, double width, double height) {
    return mass * (width * width + height * height) / 12.0;
}

} // namespace Entities
