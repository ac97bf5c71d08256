/**
 * @file broadphase.hpp
 * @brief Broad-phase collision culling with a uniform spatial hash
 *
 * Bodies are bucketed by the cell containing their center. Only bodies in
 * the same or adjacent cells become candidate pairs, so the cell size must
 * be at least the largest body extent for the culling to be conservative.
 * The hash is rebuilt from scratch on every pass and holds entity handles
 * only.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "planar/core/system_config.hpp"
#include "planar/systems/collision/collision_data.hpp"

namespace Collision {

/**
 * @brief Integer grid coordinates of a cell
 */
struct CellKey {
    int64_t x;
    int64_t y;

    bool operator==(const CellKey& other) const { return x == other.x && y == other.y; }
    bool operator!=(const CellKey& other) const { return !(*this == other); }
};

struct CellKeyHash {
    size_t operator()(const CellKey& key) const {
        size_t const hx = std::hash<int64_t>{}(key.x);
        size_t const hy = std::hash<int64_t>{}(key.y);
        return hx ^ (hy + 0x9e3779b97f4a7c15ULL + (hx << 6) + (hx >> 2));
    }
};

/**
 * @brief Cell of a point: (floor(x / cellSize), floor(y / cellSize))
 *
 * Flooring keeps negative coordinates in their own cells: (-0.5, -0.5)
 * lands in (-1, -1), not (0, 0).
 */
CellKey cellKeyFor(const Vector& position, double cellSize);

class SpatialHash {
public:
    /**
     * @throws Errors::InvalidArgument if cellSize is not positive
     */
    explicit SpatialHash(double cellSize);

    /** @brief Adds a body at the given center */
    void insert(entt::entity entity, const Vector& position);

    void clear();

    /**
     * @brief Candidate pairs for every inserted body, sources in insertion order
     *
     * AllNeighbors yields each unordered pair twice (once per source).
     * Forward yields each unordered pair exactly once. No self-pairs.
     */
    std::vector<CandidatePair> candidatePairs(NeighborPolicy policy) const;

    /** @brief Bodies in a cell, in insertion order; empty if none */
    const std::vector<entt::entity>& bodiesIn(const CellKey& key) const;

    size_t size() const { return entries.size(); }
    size_t cellCount() const { return cells.size(); }
    double getCellSize() const { return cellSize; }

private:
    struct Entry {
        entt::entity entity;
        CellKey key;
        size_t slot; ///< index inside its cell's list
    };

    double cellSize;
    std::unordered_map<CellKey, std::vector<entt::entity>, CellKeyHash> cells;
    std::vector<Entry> entries;
};

/**
 * @class Broadphase
 * @brief Builds the spatial hash over every collidable body and returns candidate pairs
 */
class Broadphase {
public:
    /**
     * @brief Buckets every entity with Position and CollisionMesh
     *
     * @param registry EnTT registry containing entities and components
     * @param sysConfig Supplies CellSize and the neighbor policy
     * @return Entity pairs that may collide
     */
    static std::vector<CandidatePair> detectCollisions(entt::registry& registry,
                                                       const SystemConfig& sysConfig);
};

} // namespace Collision
