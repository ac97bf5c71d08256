/**
 * @file collision_system.cpp
 * @brief Implementation of the collision pipeline
 */

#include "planar/systems/collision/collision_system.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <unordered_set>
#include <vector>

#include "planar/components/basic.hpp"
#include "planar/components/collision.hpp"
#include "planar/core/debug.hpp"
#include "planar/core/profile.hpp"
#include "planar/systems/collision/broadphase.hpp"
#include "planar/systems/collision/collision_response.hpp"
#include "planar/systems/collision/sat.hpp"

namespace Systems {

static uint64_t unorderedPairKey(entt::entity a, entt::entity b) {
    auto const ia = static_cast<uint64_t>(entt::to_integral(a));
    auto const ib = static_cast<uint64_t>(entt::to_integral(b));
    return (std::min(ia, ib) << 32) | std::max(ia, ib);
}

static bool isRigid(const entt::registry& registry, entt::entity entity) {
    return registry.all_of<Components::Mass, Components::Velocity>(entity);
}

Components::WorldMesh CollisionSystem::worldMeshOf(const entt::registry& registry, entt::entity entity) {
    const auto& pos = registry.get<Components::Position>(entity);
    const auto& mesh = registry.get<Components::CollisionMesh>(entity);

    double angle = 0.0;
    if (const auto* ang = registry.try_get<Components::AngularPosition>(entity)) {
        angle = ang->angle;
    }
    double scale = 1.0;
    if (const auto* sc = registry.try_get<Components::Scale>(entity)) {
        scale = sc->value;
    }
    return mesh.world(pos, angle, scale);
}

void CollisionSystem::notify(entt::registry& registry, entt::entity self, entt::entity other) {
    if (!registry.valid(self) || !registry.valid(other)) {
        return;
    }
    if (const auto* cb = registry.try_get<Components::CollisionCallback>(self)) {
        // copied: the callback may destroy self or grow the callback storage
        auto const onCollision = cb->onCollision;
        if (onCollision) {
            onCollision(registry, self, other);
        }
    }
}

void CollisionSystem::update(entt::registry& registry, double /*dt*/) {
    PROFILE_SCOPE("CollisionSystem::update");

    stats.clear();
    auto const pairs = Collision::Broadphase::detectCollisions(registry, sysConfig);
    stats.candidatePairs = pairs.size();

    // every pair is tested against the positions of this tick, before any body moves
    std::vector<Collision::Contact> contacts;
    {
        PROFILE_SCOPE("CollisionSystem::narrowphase");
        for (const auto& pair : pairs) {
            try {
                auto const meshS = worldMeshOf(registry, pair.eA);
                auto const meshT = worldMeshOf(registry, pair.eB);
                auto const axis = Collision::separatingAxisTest(meshS.polygon(), meshT.polygon());
                if (axis) {
                    contacts.push_back({pair.eA, pair.eB, *axis});
                }
            } catch (const std::exception& e) {
                ++stats.failures;
                WARN_MSG("CollisionSystem", "pair (" << entt::to_integral(pair.eA) << ", "
                                           << entt::to_integral(pair.eB) << ") skipped: " << e.what());
            }
        }
    }
    stats.contacts = contacts.size();

    // Forward emits each pair once, so the target is notified from the same contact
    bool const notifyTarget = sysConfig.Neighbors == Collision::NeighborPolicy::Forward;
    for (const auto& contact : contacts) {
        try {
            notify(registry, contact.source, contact.target);
            if (notifyTarget) {
                notify(registry, contact.target, contact.source);
            }
        } catch (const std::exception& e) {
            ++stats.failures;
            WARN_MSG("CollisionSystem", "callback for (" << entt::to_integral(contact.source) << ", "
                                       << entt::to_integral(contact.target) << ") failed: " << e.what());
        }
    }

    {
        PROFILE_SCOPE("CollisionSystem::response");
        std::unordered_set<uint64_t> resolvedPairs;
        for (const auto& contact : contacts) {
            // a callback may have destroyed either body
            if (!registry.valid(contact.source) || !registry.valid(contact.target) ||
                !isRigid(registry, contact.source) || !isRigid(registry, contact.target)) {
                continue;
            }
            if (!resolvedPairs.insert(unorderedPairKey(contact.source, contact.target)).second) {
                continue;
            }
            try {
                if (Collision::resolveCollision(registry, contact.source, contact.target, contact.axis,
                                                sysConfig.CollisionCoeffRestitution)) {
                    ++stats.resolved;
                }
            } catch (const std::exception& e) {
                ++stats.failures;
                WARN_MSG("CollisionSystem", "response for (" << entt::to_integral(contact.source) << ", "
                                           << entt::to_integral(contact.target) << ") failed: " << e.what());
            }
        }
    }

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[CollisionSystem] pairs=" << stats.candidatePairs
                                 << " contacts=" << stats.contacts
                                 << " resolved=" << stats.resolved
                                 << " failures=" << stats.failures << "\n");
}

} // namespace Systems
