/**
 * @file snake.cpp
 * @brief Procedural snake driven through a constrained chain.
 *
 * Segment i sits segmentRadius[i] to the right of segment i-1 at start, so
 * each link length equals the child's radius. The head traces a
 * figure-eight (Lissajous 1:2) standing in for the pointer an interactive
 * host would follow.
 */

#include "planar/scenarios/snake.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "planar/components/basic.hpp"
#include "planar/core/errors.hpp"
#include "planar/kinematics/constrained_body.hpp"
#include "planar/math/constants.hpp"

SystemConfig SnakeScenario::getConfig() const {
  SystemConfig cfg;
  cfg.SecondsPerTick = 1.0 / 60.0;
  cfg.CellSize = 100.0;
  // the chain is kinematic: no dynamics or collisions needed
  cfg.activeSystems = {};
  return cfg;
}

Vector SnakeScenario::headPosition(double time) const {
  double const phase = MathConstants::TWO_PI * time / scenarioConfig.pathPeriod;
  double const r = scenarioConfig.pathRadius;
  return Vector(r * std::sin(phase), 100.0 + 0.5 * r * std::sin(2.0 * phase));
}

void SnakeScenario::createEntities(entt::registry& registry) const {
  const auto& radii = scenarioConfig.segmentRadius;
  if (radii.empty()) {
    throw Errors::InvalidArgument("SnakeScenario needs at least one segment");
  }

  Kinematics::ConstrainedBody body(headPosition(0.0), "0",
                                   scenarioConfig.minAngleFraction * MathConstants::PI);
  Vector position = headPosition(0.0);
  for (size_t i = 1; i < radii.size(); ++i) {
    position = position + Vector::right(radii[i]);
    body.addNodeToParent(position, std::to_string(i), std::to_string(i - 1));
  }

  auto snake = registry.create();
  registry.emplace<Kinematics::ConstrainedBody>(snake, std::move(body));
  registry.emplace<SnakeShape>(snake, SnakeShape{radii});
  registry.emplace<Components::Color>(snake, 90, 170, 90);
}

void SnakeScenario::beforeStep(entt::registry& registry, double time, double dt) const {
  auto view = registry.view<Kinematics::ConstrainedBody>();
  for (auto entity : view) {
    view.get<Kinematics::ConstrainedBody>(entity).moveRoot(headPosition(time + dt));
  }
}
