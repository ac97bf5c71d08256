#pragma once

#include <vector>
#include "planar/systems/systems.hpp"

namespace Collision {

/**
 * @brief Which neighbor cells the broad-phase scans for each body
 */
enum class NeighborPolicy {
    AllNeighbors, ///< own cell + 8 neighbors, every unordered pair seen from both sides
    Forward,      ///< own cell + E, S, SE, SW, every unordered pair seen once
};

} // namespace Collision

/**
 * @struct SystemConfig
 * @brief Holds all system configuration parameters for the simulation.
 */
struct SystemConfig {
    double SecondsPerTick = 1.0 / 60.0;
    double CellSize = 100.0;
    double CollisionCoeffRestitution = 1.0;
    Collision::NeighborPolicy Neighbors = Collision::NeighborPolicy::AllNeighbors;

    std::vector<Systems::SystemType> activeSystems{Systems::SystemType::DYNAMICS,
                                                   Systems::SystemType::COLLISION};
};
