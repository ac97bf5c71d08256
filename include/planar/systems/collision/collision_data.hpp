/**
 * @file collision_data.hpp
 * @brief Data passed between broad-phase, narrow-phase and response
 */

#pragma once

#include <cstddef>
#include <vector>

#include <entt/entt.hpp>

#include "planar/math/vector_math.hpp"

namespace Collision {

// Ordered pair produced by the broad-phase; eA is the source
struct CandidatePair {
    entt::entity eA;
    entt::entity eB;
};

// Narrow-phase hit: axis is the minimum translation vector from SAT
struct Contact {
    entt::entity source;
    entt::entity target;
    Vector axis;
};

// Per-tick counters of the collision pipeline
struct CollisionStats {
    size_t candidatePairs = 0;
    size_t contacts = 0;
    size_t resolved = 0;
    size_t failures = 0;

    void clear() { *this = CollisionStats(); }
};

} // namespace Collision
