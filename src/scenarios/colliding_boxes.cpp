/**
 * @file colliding_boxes.cpp
 * @brief Head-on collision of two boxes and a striker hitting a row of boxes.
 *
 * All boxes are rigid and start axis-aligned. The sensor at the center is a
 * plain body: it reports overlaps through its callback but is never moved.
 */

#include "planar/scenarios/colliding_boxes.hpp"

#include "planar/entities/entity_factory.hpp"
#include "planar/math/polygon.hpp"

static Components::CollisionMesh boxMesh(double size) {
  Components::CollisionMesh mesh;
  mesh.addRect(size, size);
  return mesh;
}

static entt::entity makeBox(entt::registry& registry,
                            const Vector& position,
                            const Vector& velocity,
                            double size,
                            double mass,
                            const Components::Color& color) {
  auto box = Entities::EntityFactory::createRigidBody(
      registry, position, boxMesh(size), mass,
      Entities::rectangleInertia(mass, size, size), velocity);
  registry.emplace<Components::Color>(box, color);
  return box;
}

SystemConfig CollidingBoxesScenario::getConfig() const {
  SystemConfig cfg;
  cfg.SecondsPerTick = 1.0 / 120.0;
  cfg.CellSize = 4.0 * scenarioConfig.boxSize;
  cfg.CollisionCoeffRestitution = scenarioConfig.restitution;
  cfg.Neighbors = Collision::NeighborPolicy::AllNeighbors;
  cfg.activeSystems = {Systems::SystemType::DYNAMICS, Systems::SystemType::COLLISION};
  return cfg;
}

void CollidingBoxesScenario::createEntities(entt::registry& registry) const {
  double const size = scenarioConfig.boxSize;

  // Head-on pair
  makeBox(registry, Vector(-scenarioConfig.startOffset, 0.0),
          Vector::right(scenarioConfig.approachSpeed), size, scenarioConfig.leftMass,
          Components::Color(200, 80, 80));
  makeBox(registry, Vector(scenarioConfig.startOffset, 0.0),
          Vector::left(scenarioConfig.approachSpeed), size, scenarioConfig.rightMass,
          Components::Color(80, 80, 200));

  // Sensor counting how often something overlaps it
  auto sensor = Entities::EntityFactory::createBody(
      registry, Vector(0.0, 0.0), boxMesh(scenarioConfig.sensorSize));
  registry.emplace<ContactCounter>(sensor);
  registry.emplace<Components::Color>(sensor, 60, 60, 60);
  Entities::EntityFactory::setCollisionCallback(
      registry, sensor,
      [](entt::registry& reg, entt::entity self, entt::entity /*other*/) {
        reg.get<ContactCounter>(self).count += 1;
      });

  // Striker and resting row
  double const pitch = size + scenarioConfig.cradleGap;
  double const y = scenarioConfig.cradleHeight;
  makeBox(registry, Vector(-2.0 * pitch, y), Vector::right(scenarioConfig.approachSpeed),
          size, 1.0, Components::Color(220, 200, 60));
  for (int i = 0; i < scenarioConfig.cradleCount; ++i) {
    makeBox(registry, Vector(i * pitch, y), Vector(), size, 1.0,
            Components::Color(180, 180, 180));
  }
}
