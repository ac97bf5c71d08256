/**
 * @fileoverview simulator.cpp
 * @brief Implementation of Simulator.
 */

#include "planar/core/simulator.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

#include "planar/components/basic.hpp"
#include "planar/core/errors.hpp"
#include "planar/core/profile.hpp"
#include "planar/systems/collision/collision_system.hpp"
#include "planar/systems/dynamics.hpp"

static void validateConfig(const SystemConfig& cfg) {
  if (!(cfg.SecondsPerTick > 0.0)) {
    throw Errors::InvalidArgument("SystemConfig.SecondsPerTick must be positive, got "
                                  + std::to_string(cfg.SecondsPerTick));
  }
  if (!(cfg.CellSize > 0.0)) {
    throw Errors::InvalidArgument("SystemConfig.CellSize must be positive, got "
                                  + std::to_string(cfg.CellSize));
  }
}

Simulator::Simulator() {
  createSystems();
}

Simulator::Simulator(const SystemConfig& cfg) {
  applyConfig(cfg);
}

Simulator::~Simulator() = default;

void Simulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  scenarioPtr = std::move(scenario);
  if (scenarioPtr) {
    applyConfig(scenarioPtr->getConfig());
  }
  reset();
}

void Simulator::applyConfig(const SystemConfig& cfg) {
  validateConfig(cfg);
  currentConfig = cfg;
  createSystems();
}

void Simulator::reset() {
  registry.clear();
  ticks = 0;
  simulatedTime = 0.0;
  totalStats.clear();

  if (scenarioPtr) {
    scenarioPtr->createEntities(registry);
  }
  std::cout << "Simulator::reset() " << registry.view<Components::Position>().size() << " bodies\n";
}

void Simulator::createSystems() {
  systems.clear();
  collisionSystem = nullptr;

  for (auto type : currentConfig.activeSystems) {
    switch (type) {
      case Systems::SystemType::DYNAMICS:
        systems.push_back(std::make_unique<Systems::DynamicsSystem>());
        break;
      case Systems::SystemType::COLLISION: {
        auto collision = std::make_unique<Systems::CollisionSystem>();
        collisionSystem = collision.get();
        systems.push_back(std::move(collision));
        break;
      }
    }
  }

  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

void Simulator::tick(double dt) {
  PROFILE_SCOPE("Simulator::tick");

  if (scenarioPtr) {
    scenarioPtr->beforeStep(registry, simulatedTime, dt);
  }

  for (auto& system : systems) {
    system->update(registry, dt);
  }

  if (collisionSystem != nullptr) {
    const auto& stats = collisionSystem->lastStats();
    totalStats.candidatePairs += stats.candidatePairs;
    totalStats.contacts += stats.contacts;
    totalStats.resolved += stats.resolved;
    totalStats.failures += stats.failures;
  }

  ++ticks;
  simulatedTime += dt;
}

int Simulator::advance(double elapsed) {
  if (std::isnan(elapsed)) {
    throw Errors::InvalidArgument("Simulator::advance() elapsed time is NaN");
  }
  if (elapsed <= 0.0) {
    return 0;
  }
  // tolerance so that elapsed == k * SecondsPerTick runs k ticks despite rounding
  double const wholeTicks = std::floor(elapsed / currentConfig.SecondsPerTick + 1e-9);
  if (wholeTicks > static_cast<double>(std::numeric_limits<int>::max())) {
    throw Errors::InvalidArgument("Simulator::advance() elapsed time " + std::to_string(elapsed)
                                  + "s is too many ticks for one call");
  }
  int const steps = static_cast<int>(wholeTicks);
  for (int i = 0; i < steps; ++i) {
    tick(currentConfig.SecondsPerTick);
  }
  return steps;
}
