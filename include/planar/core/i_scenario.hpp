#ifndef PLANAR_I_SCENARIO_HPP
#define PLANAR_I_SCENARIO_HPP

#include <entt/entt.hpp>
#include "planar/core/system_config.hpp"

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getConfig() returning the SystemConfig it runs with
 *  - createEntities() that spawns all ECS entities
 *
 * beforeStep() is called by the simulator ahead of every tick; scenarios
 * use it to feed forces or drive kinematic bodies.
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual SystemConfig getConfig() const = 0;

    virtual void createEntities(entt::registry &registry) const = 0;

    /**
     * @param time Simulated time at the start of the step, in seconds
     * @param dt Length of the step about to run
     */
    virtual void beforeStep(entt::registry &registry, double time, double dt) const {
        (void)registry;
        (void)time;
        (void)dt;
    }
};

#endif // PLANAR_I_SCENARIO_HPP
