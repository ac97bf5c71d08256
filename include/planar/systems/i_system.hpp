/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems of the engine
 */

#pragma once

#include <entt/entt.hpp>
#include "planar/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * The simulator owns its systems, pushes configuration to them and
 * updates them in order once per tick.
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Advances the system by one step
     *
     * @param registry EnTT registry holding every body
     * @param dt Step length in seconds
     */
    virtual void update(entt::registry& registry, double dt) = 0;

    /**
     * @brief Sets the system configuration
     */
    virtual void setSystemConfig(const SystemConfig& config) = 0;
};

} // namespace Systems
