#include "planar/systems/dynamics.hpp"

#include <exception>

#include "planar/components/basic.hpp"
#include "planar/core/debug.hpp"
#include "planar/core/errors.hpp"
#include "planar/core/profile.hpp"

namespace Systems {

void DynamicsSystem::integrate(entt::registry& registry, entt::entity entity, double dt) {
    if (!registry.all_of<Components::Position, Components::Velocity, Components::Acceleration,
                         Components::AngularPosition, Components::AngularVelocity,
                         Components::AngularAcceleration, Components::NetForce,
                         Components::Mass, Components::Inertia>(entity)) {
        throw Errors::InvalidArgument("DynamicsSystem::integrate() on an entity that is not a rigid body");
    }

    double const mass = registry.get<Components::Mass>(entity).value;
    double const inertia = registry.get<Components::Inertia>(entity).I;
    if (mass <= 0.0 || inertia <= 0.0) {
        throw Errors::InvalidArgument("DynamicsSystem::integrate() needs positive mass and inertia");
    }

    auto& pos = registry.get<Components::Position>(entity);
    auto& vel = registry.get<Components::Velocity>(entity);
    auto& acc = registry.get<Components::Acceleration>(entity);
    auto& angle = registry.get<Components::AngularPosition>(entity);
    auto& omega = registry.get<Components::AngularVelocity>(entity);
    auto& alpha = registry.get<Components::AngularAcceleration>(entity);
    auto& net = registry.get<Components::NetForce>(entity);

    acc.value = net.force / mass;
    vel = vel + acc.value * dt;
    pos = pos + vel * dt;

    alpha.alpha = net.torque / inertia;
    omega.omega += alpha.alpha * dt;
    angle.angle += omega.omega * dt;

    net.force = Vector();
    net.torque = 0.0;
}

void DynamicsSystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("DynamicsSystem::update");

    failures = 0;
    size_t integrated = 0;
    auto view = registry.view<Components::NetForce, Components::Mass, Components::Inertia>();
    for (auto entity : view) {
        try {
            integrate(registry, entity, dt);
            ++integrated;
        } catch (const std::exception& e) {
            ++failures;
            WARN_MSG("DynamicsSystem", "entity " << entt::to_integral(entity) << " skipped: " << e.what());
        }
    }
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[DynamicsSystem] integrated " << integrated
                                   << " bodies over " << dt << "s\n");
}

} // namespace Systems
