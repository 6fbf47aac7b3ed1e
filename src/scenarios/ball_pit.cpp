/**
 * @file ball_pit.cpp
 * @brief Implementation of a scenario with many random bodies
 *
 * Bodies are placed in the top band of the world with random radius, colour
 * and initial velocity. Mass follows area so larger bodies are heavier.
 */

#include <algorithm>
#include <cmath>
#include <random>

#include "discsim/scenarios/ball_pit.hpp"

SystemConfig BallPitScenario::getConfig() const {
  SystemConfig cfg;
  cfg.Elasticity = 0.6;
  return cfg;
}

void BallPitScenario::createBodies(BodyStore &store) const {
  const SystemConfig cfg = getConfig();
  const auto& sc = scenarioConfig;

  std::default_random_engine gen{sc.seed};
  std::uniform_real_distribution<double> radiusDist(sc.radiusMin, sc.radiusMax);
  std::uniform_real_distribution<double> unitDist(0.0, 1.0);
  std::uniform_real_distribution<double> speedDist(-sc.maxInitialSpeed, sc.maxInitialSpeed);
  std::uniform_int_distribution<int> colorDist(40, 255);

  const double pi = std::acos(-1.0);

  for (int i = 0; i < sc.bodyCount; ++i) {
    const double r = radiusDist(gen);

    // Keep the whole disc inside the spawn band.
    const double xMin = r;
    const double xMax = cfg.WorldWidth - r;
    const double yMin = r;
    const double yMax = std::max(yMin, std::min(sc.spawnBandHeight, cfg.WorldHeight) - r);

    BodyDefinition def;
    def.position = Vector2D(xMin + unitDist(gen) * (xMax - xMin),
                            yMin + unitDist(gen) * (yMax - yMin));
    def.velocity = Vector2D(speedDist(gen), speedDist(gen));
    def.radius = r;
    def.mass = sc.density * pi * r * r;
    def.color = Components::Color(static_cast<uint8_t>(colorDist(gen)),
                                  static_cast<uint8_t>(colorDist(gen)),
                                  static_cast<uint8_t>(colorDist(gen)));
    store.addBody(def);
  }
}
