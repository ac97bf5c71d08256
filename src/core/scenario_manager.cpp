/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include "planar/core/scenario_manager.hpp"

#include "planar/core/errors.hpp"
#include "planar/scenarios/colliding_boxes.hpp"
#include "planar/scenarios/snake.hpp"

const std::vector<std::string>& ScenarioManager::getScenarioNames() {
  static const std::vector<std::string> names{"colliding_boxes", "snake"};
  return names;
}

std::unique_ptr<IScenario> ScenarioManager::createScenario(const std::string& name) {
  if (name == "colliding_boxes") {
    return std::make_unique<CollidingBoxesScenario>();
  }
  if (name == "snake") {
    return std::make_unique<SnakeScenario>();
  }

  std::string known;
  for (const auto& n : getScenarioNames()) {
    known += (known.empty() ? "" : ", ") + n;
  }
  throw Errors::InvalidArgument("unknown scenario '" + name + "' (known: " + known + ")");
}
