/**
 * @file dynamics.hpp
 * @brief Semi-implicit Euler integration of rigid bodies
 *
 * This system handles:
 * - Linear motion: a = F/m, v += a*dt, p += v*dt
 * - Angular motion: alpha = tau/I, omega += alpha*dt, angle += omega*dt
 * - Clearing the NetForce accumulator once it has been applied
 *
 * Required components:
 * - Position, Velocity, Acceleration, Mass
 * - AngularPosition, AngularVelocity, AngularAcceleration, Inertia
 * - NetForce (to read and clear)
 */

#ifndef PLANAR_DYNAMICS_HPP
#define PLANAR_DYNAMICS_HPP

#include <cstddef>
#include <entt/entt.hpp>

#include "planar/systems/i_system.hpp"

namespace Systems {

class DynamicsSystem : public ISystem {
public:
    DynamicsSystem() = default;

    /**
     * @brief Integrates one rigid body over dt
     *
     * Velocity is updated before position, so a force applied this tick
     * already moves the body this tick.
     */
    static void integrate(entt::registry& registry, entt::entity entity, double dt);

    /**
     * @brief Integrates every rigid body
     *
     * A body whose integration throws is reported on std::cerr and skipped;
     * the other bodies still advance.
     */
    void update(entt::registry& registry, double dt) override;

    void setSystemConfig(const SystemConfig& config) override { sysConfig = config; }

    /** @brief Bodies that failed during the last update */
    size_t lastFailures() const { return failures; }

private:
    SystemConfig sysConfig;
    size_t failures = 0;
};

} // namespace Systems

#endif
