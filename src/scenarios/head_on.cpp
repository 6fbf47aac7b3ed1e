#include "discsim/scenarios/head_on.hpp"

SystemConfig HeadOnScenario::getConfig() const {
  SystemConfig cfg;
  cfg.GravityMagnitude = 0.0;
  cfg.Elasticity = 1.0;
  cfg.FrictionEnabled = false;
  return cfg;
}

void HeadOnScenario::createBodies(BodyStore &store) const {
  const SystemConfig cfg = getConfig();
  const double cx = cfg.WorldWidth / 2.0;
  const double cy = cfg.WorldHeight / 2.0;
  const double half = scenarioConfig.separation / 2.0;

  BodyDefinition left;
  left.position = Vector2D(cx - half, cy);
  left.velocity = Vector2D(scenarioConfig.speed, 0.0);
  left.mass = scenarioConfig.mass;
  left.radius = scenarioConfig.radius;
  left.color = Components::Color(220, 60, 60);
  store.addBody(left);

  BodyDefinition right = left;
  right.position = Vector2D(cx + half, cy);
  right.velocity = Vector2D(-scenarioConfig.speed, 0.0);
  right.color = Components::Color(60, 60, 220);
  store.addBody(right);
}
