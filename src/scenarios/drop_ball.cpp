#include "discsim/scenarios/drop_ball.hpp"

SystemConfig DropBallScenario::getConfig() const {
  // Plain defaults: 800x600, g = 9.8, friction on, e = 0.7.
  return SystemConfig{};
}

void DropBallScenario::createBodies(BodyStore &store) const {
  BodyDefinition def;
  def.position = Vector2D(scenarioConfig.startX, scenarioConfig.startY);
  def.mass = scenarioConfig.mass;
  def.radius = scenarioConfig.radius;
  def.color = scenarioConfig.color;
  store.addBody(def);
}
