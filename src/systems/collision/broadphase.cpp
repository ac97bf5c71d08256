/**
 * @file broadphase.cpp
 * @brief Implementation of the spatial hash broad-phase
 */

#include "planar/systems/collision/broadphase.hpp"

#include <array>
#include <cmath>
#include <string>

#include "planar/components/basic.hpp"
#include "planar/core/debug.hpp"
#include "planar/core/errors.hpp"
#include "planar/core/profile.hpp"
#include "planar/systems/collision/collision_mesh.hpp"

namespace Collision {

namespace {

struct CellOffset {
    int dx;
    int dy;
};

// y grows upward: south is dy = -1
constexpr std::array<CellOffset, 8> kNeighborOffsets{{
    {-1, 1}, {0, 1}, {1, 1},
    {-1, 0},         {1, 0},
    {-1, -1}, {0, -1}, {1, -1},
}};

// east, south, southeast, southwest; the other four are their opposites
constexpr std::array<CellOffset, 4> kForwardOffsets{{
    {1, 0}, {0, -1}, {1, -1}, {-1, -1},
}};

const std::vector<entt::entity> kEmptyCell;

} // namespace

CellKey cellKeyFor(const Vector& position, double cellSize) {
    return CellKey{static_cast<int64_t>(std::floor(position.x / cellSize)),
                   static_cast<int64_t>(std::floor(position.y / cellSize))};
}

SpatialHash::SpatialHash(double cellSize) : cellSize(cellSize) {
    if (!(cellSize > 0.0)) {
        throw Errors::InvalidArgument("SpatialHash cell size must be positive, got " + std::to_string(cellSize));
    }
}

void SpatialHash::insert(entt::entity entity, const Vector& position) {
    CellKey const key = cellKeyFor(position, cellSize);
    auto& cell = cells[key];
    entries.push_back(Entry{entity, key, cell.size()});
    cell.push_back(entity);
}

void SpatialHash::clear() {
    cells.clear();
    entries.clear();
}

const std::vector<entt::entity>& SpatialHash::bodiesIn(const CellKey& key) const {
    auto it = cells.find(key);
    return it == cells.end() ? kEmptyCell : it->second;
}

std::vector<CandidatePair> SpatialHash::candidatePairs(NeighborPolicy policy) const {
    std::vector<CandidatePair> pairs;

    for (const auto& entry : entries) {
        const auto& own = bodiesIn(entry.key);

        if (policy == NeighborPolicy::AllNeighbors) {
            for (auto other : own) {
                if (other != entry.entity) {
                    pairs.push_back({entry.entity, other});
                }
            }
            for (const auto& off : kNeighborOffsets) {
                for (auto other : bodiesIn({entry.key.x + off.dx, entry.key.y + off.dy})) {
                    pairs.push_back({entry.entity, other});
                }
            }
        } else {
            // own cell: pair only with bodies inserted later
            for (size_t i = entry.slot + 1; i < own.size(); ++i) {
                pairs.push_back({entry.entity, own[i]});
            }
            for (const auto& off : kForwardOffsets) {
                for (auto other : bodiesIn({entry.key.x + off.dx, entry.key.y + off.dy})) {
                    pairs.push_back({entry.entity, other});
                }
            }
        }
    }
    return pairs;
}

std::vector<CandidatePair> Broadphase::detectCollisions(entt::registry& registry,
                                                        const SystemConfig& sysConfig) {
    PROFILE_SCOPE("Broadphase::detectCollisions");

    SpatialHash hash(sysConfig.CellSize);

    // the world mesh is centered on the body position
    auto view = registry.view<Components::Position, Components::CollisionMesh>();
    for (auto entity : view) {
        hash.insert(entity, view.get<Components::Position>(entity));
    }

    auto pairs = hash.candidatePairs(sysConfig.Neighbors);
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Broadphase] " << hash.size() << " bodies in "
                                   << hash.cellCount() << " cells, "
                                   << pairs.size() << " candidate pairs\n");
    return pairs;
}

} // namespace Collision
