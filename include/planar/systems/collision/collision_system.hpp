/**
 * @file collision_system.hpp
 * @brief Collision pipeline: broad-phase, SAT, callbacks, response
 *
 * Candidate pairs come from the spatial hash. All pairs are first tested
 * with SAT on the world collision meshes. Every contact then notifies the
 * source's CollisionCallback (and the target's under the Forward policy,
 * which emits each pair once). Last, contacts between two rigid bodies are
 * resolved, at most once per unordered pair.
 */

#pragma once

#include <entt/entt.hpp>

#include "planar/systems/collision/collision_data.hpp"
#include "planar/systems/collision/collision_mesh.hpp"
#include "planar/systems/i_system.hpp"

namespace Systems {

class CollisionSystem : public ISystem {
public:
    CollisionSystem() = default;

    /**
     * @brief Runs the pipeline over every body with Position and CollisionMesh
     *
     * A pair whose processing throws (missing shape, throwing callback) is
     * reported on std::cerr and counted in the stats; the remaining pairs
     * are still processed.
     */
    void update(entt::registry& registry, double dt) override;

    void setSystemConfig(const SystemConfig& config) override { sysConfig = config; }

    /** @brief Counters of the last update */
    const Collision::CollisionStats& lastStats() const { return stats; }

    /**
     * @brief Collision mesh of a body placed at its current transform
     *
     * AngularPosition and Scale are optional and default to 0 and 1.
     */
    static Components::WorldMesh worldMeshOf(const entt::registry& registry, entt::entity entity);

private:
    static void notify(entt::registry& registry, entt::entity self, entt::entity other);

    SystemConfig sysConfig;
    Collision::CollisionStats stats;
};

} // namespace Systems
