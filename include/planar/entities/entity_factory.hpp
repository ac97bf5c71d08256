#pragma once

#include <entt/entt.hpp>

#include "planar/components/basic.hpp"
#include "planar/components/collision.hpp"
#include "planar/systems/collision/collision_mesh.hpp"

namespace Entities {

/**
 * Factory for the two body kinds of the engine.
 * A body has a transform and a collision mesh; a rigid body adds mass,
 * inertia and the state integrated by the dynamics system.
 */
class EntityFactory {
public:
    /**
     * Creates a body that collides but is never moved by the engine.
     *
     * @param registry The entity registry
     * @param position Initial center of the body
     * @param mesh Collision shapes in the body's local frame
     * @param angle Initial orientation in radians
     * @param scale Uniform scale applied to the mesh
     * @return The created entity
     */
    static entt::entity createBody(
        entt::registry& registry,
        const Components::Position& position,
        Components::CollisionMesh mesh,
        double angle = 0.0,
        double scale = 1.0
    );

    /**
     * Creates a body with dynamics state at rest.
     *
     * @throws Errors::InvalidArgument if mass or inertia is not positive
     */
    static entt::entity createRigidBody(
        entt::registry& registry,
        const Components::Position& position,
        Components::CollisionMesh mesh,
        double mass,
        double inertia,
        const Components::Velocity& velocity = Components::Velocity(),
        double angle = 0.0,
        double scale = 1.0
    );

    /**
     * Attaches a collision callback, replacing any previous one.
     */
    static void setCollisionCallback(
        entt::registry& registry,
        entt::entity entity,
        decltype(Components::CollisionCallback::onCollision) callback
    );
};

/**
 * Adds force and torque to the body's accumulator for the next tick.
 *
 * @throws Errors::InvalidArgument if the entity is not a rigid body
 */
void applyForce(entt::registry& registry, entt::entity entity, const Vector& force, double torque = 0.0);

/**
 * Moment of inertia of a solid rectangle about its center: m(w² + h²)/12.
 */
double rectangleInertia(double mass, double width, double height);

} // namespace Entities
