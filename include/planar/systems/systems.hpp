#pragma once

/**
 * @brief Defines the ECS systems a scenario can activate.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief Systems run by the simulator, in this order, each tick.
 */
enum class SystemType {
    DYNAMICS,
    COLLISION,
};

} // namespace Systems
