/**
 * @file snake.hpp
 * @brief Declaration of the SnakeScenario class
 */

#pragma once

#include <utility>
#include <vector>
#include <entt/entt.hpp>
#include "planar/core/i_scenario.hpp"
#include "planar/math/vector_math.hpp"

/**
 * @struct SnakeConfig
 * @brief Parameters of the procedural snake
 */
struct SnakeConfig {
    // Segment radii from head to tail; neighbors are spaced by the child's radius
    std::vector<double> segmentRadius{30, 35, 40, 30, 30, 30, 30, 30, 30, 30, 30, 30,
                                      30, 30, 30, 28, 25, 25, 22, 22, 20, 20, 20, 20,
                                      20, 20, 18, 18, 16, 16, 14, 14, 12, 12, 10, 10};
    double minAngleFraction = 0.8;  // Minimum bend as a fraction of pi
    double pathRadius = 200.0;      // Amplitude of the head's figure-eight path
    double pathPeriod = 6.0;        // Seconds per lap
};

/**
 * @brief Radii drawn around each node of the snake's chain
 */
struct SnakeShape {
    std::vector<double> segmentRadius;
};

/**
 * @class SnakeScenario
 *
 * A single constrained chain whose head follows a figure-eight; the body
 * trails behind under the distance and angle constraints.
 */
class SnakeScenario : public IScenario {
public:
    SnakeScenario() = default;
    explicit SnakeScenario(SnakeConfig config) : scenarioConfig(std::move(config)) {}
    ~SnakeScenario() override = default;

    SystemConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;
    void beforeStep(entt::registry &registry, double time, double dt) const override;

    /** @brief Head position on the path at a given time */
    Vector headPosition(double time) const;

private:
    SnakeConfig scenarioConfig;
};
