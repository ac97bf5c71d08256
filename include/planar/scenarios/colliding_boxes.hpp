/**
 * @file colliding_boxes.hpp
 * @brief Declaration of the CollidingBoxesScenario class
 */

#pragma once

#include <entt/entt.hpp>
#include "planar/core/i_scenario.hpp"

/**
 * @struct CollidingBoxesConfig
 * @brief Parameters of the colliding boxes scenario
 */
struct CollidingBoxesConfig {
    double boxSize = 20.0;          // Side length of every box
    double leftMass = 1.0;
    double rightMass = 3.0;
    double approachSpeed = 40.0;    // Speed of each box toward the center
    double startOffset = 60.0;      // Distance of each box from the center
    double restitution = 1.0;
    int cradleCount = 3;            // Resting boxes in a row, hit by a striker
    double cradleHeight = 100.0;    // y of the cradle row
    double cradleGap = 2.0;         // Space between neighboring boxes of the row
    double sensorSize = 30.0;       // Static body at the center counting contacts
};

/**
 * @brief Contacts seen by a body's collision callback
 */
struct ContactCounter {
    int count = 0;
};

/**
 * @class CollidingBoxesScenario
 *
 * Two boxes of different mass meet head-on over a static sensor body. Above
 * them a striker runs into a row of resting boxes of equal mass.
 */
class CollidingBoxesScenario : public IScenario {
public:
    CollidingBoxesScenario() = default;
    explicit CollidingBoxesScenario(const CollidingBoxesConfig& config) : scenarioConfig(config) {}
    ~CollidingBoxesScenario() override = default;

    SystemConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

private:
    CollidingBoxesConfig scenarioConfig;
};
