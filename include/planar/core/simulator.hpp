/**
 * @file simulator.hpp
 * @brief Owns the ECS registry and the systems, and steps them.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "planar/core/i_scenario.hpp"
#include "planar/core/system_config.hpp"
#include "planar/systems/collision/collision_data.hpp"
#include "planar/systems/i_system.hpp"

namespace Systems {
class CollisionSystem;
}

/**
 * @class Simulator
 * @brief Runs the active systems over the registry, one tick at a time.
 *
 * Systems run in the order of SystemConfig::activeSystems. Bodies can be
 * created directly in the registry or by a loaded scenario.
 */
class Simulator {
private:
    entt::registry registry;
    std::unique_ptr<IScenario> scenarioPtr;
    SystemConfig currentConfig;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::CollisionSystem* collisionSystem = nullptr;

    uint64_t ticks = 0;
    double simulatedTime = 0.0;
    Collision::CollisionStats totalStats;

    void createSystems();

public:
    Simulator();
    explicit Simulator(const SystemConfig& cfg);
    ~Simulator();

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    /**
     * @brief Takes ownership of a scenario, applies its config and resets
     */
    void loadScenario(std::unique_ptr<IScenario> scenario);

    /**
     * @brief Replaces the configuration and rebuilds the system list
     */
    void applyConfig(const SystemConfig& cfg);

    /**
     * @brief Clears the registry and respawns the scenario's entities
     */
    void reset();

    /**
     * @brief Steps every active system once over dt seconds
     */
    void tick(double dt);

    /** @brief One tick of SecondsPerTick */
    void tick() { tick(currentConfig.SecondsPerTick); }

    /**
     * @brief Runs floor(elapsed / SecondsPerTick) fixed ticks
     *
     * The remainder is dropped, not carried to the next call.
     *
     * @return Number of ticks run
     * @throws Errors::InvalidArgument if elapsed is NaN or needs more than INT_MAX ticks
     */
    int advance(double elapsed);

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }
    const SystemConfig& getConfig() const { return currentConfig; }

    uint64_t getTickCount() const { return ticks; }
    double getSimulatedTime() const { return simulatedTime; }

    /** @brief Collision counters summed over every tick since the last reset */
    const Collision::CollisionStats& getCollisionStats() const { return totalStats; }
};
