/**
 * @fileoverview simulator.cpp
 * @brief Implementation of ECSSimulator.
 */

#include "discsim/core/simulator.hpp"

#include <iostream>
#include <utility>

#include "discsim/core/debug.hpp"
#include "discsim/core/profile.hpp"
#include "discsim/systems/boundary.hpp"
#include "discsim/systems/collision.hpp"
#include "discsim/systems/integrator.hpp"

ECSSimulator::ECSSimulator() : ECSSimulator(SystemConfig{}) {}

ECSSimulator::ECSSimulator(const SystemConfig& config) : currentConfig(config) {
  createSystems();
}

ECSSimulator::~ECSSimulator() = default;

void ECSSimulator::createSystems() {
  systems.clear();

  // Order matters: integrate, then resolve contacts, then contain.
  systems.push_back(std::make_unique<Systems::IntegratorSystem>());
  auto collision = std::make_unique<Systems::CollisionSystem>();
  collisionSystem = collision.get();
  systems.push_back(std::move(collision));
  systems.push_back(std::make_unique<Systems::BoundarySystem>());

  pushConfig();
}

void ECSSimulator::pushConfig() {
  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

// --- Bodies ---

Components::BodyId ECSSimulator::addBody(const BodyDefinition& def) {
  return store.addBody(def);
}

Components::BodyId ECSSimulator::addBody(const Vector2D& position,
                                         const Vector2D& velocity,
                                         const Vector2D& acceleration,
                                         double mass,
                                         double radius,
                                         const Components::Color& color) {
  BodyDefinition def;
  def.position = position;
  def.velocity = velocity;
  def.acceleration = acceleration;
  def.mass = mass;
  def.radius = radius;
  def.color = color;
  return store.addBody(def);
}

void ECSSimulator::clearAll() {
  store.clearAll();
}

std::vector<BodySnapshot> ECSSimulator::bodies() const {
  return store.snapshot();
}

// --- Parameters ---

void ECSSimulator::applyConfig(const SystemConfig& cfg) {
  currentConfig = cfg;
  pushConfig();
}

void ECSSimulator::setGravityMagnitude(double magnitude) {
  currentConfig.GravityMagnitude = magnitude;
  pushConfig();
}

void ECSSimulator::setFrictionEnabled(bool enabled) {
  currentConfig.FrictionEnabled = enabled;
  pushConfig();
}

void ECSSimulator::setElasticity(double elasticity) {
  currentConfig.Elasticity = elasticity;
  pushConfig();
}

void ECSSimulator::setWorldBounds(double width, double height) {
  currentConfig.WorldWidth = width;
  currentConfig.WorldHeight = height;
  pushConfig();
}

void ECSSimulator::setStepMode(StepMode mode) {
  currentConfig.Mode = mode;
  accumulator = 0.0;
  pushConfig();
}

// --- Stepping ---

void ECSSimulator::tick(double dt) {
  PROFILE_SCOPE("ECSSimulator::tick");

  DebugStats::reset();

  auto& registry = store.getRegistry();
  for (auto& system : systems) {
    system->update(registry, dt);
  }

  ++tickCount;
  simulatedTime += dt;

  DebugStats::printTickStats();
}

int ECSSimulator::advance(double frameSeconds) {
  if (paused) {
    if (!stepFrame) {
      return 0;
    }
    stepFrame = false;
    tick(currentConfig.FixedTimestep);
    return 1;
  }
  stepFrame = false;

  if (currentConfig.Mode == StepMode::VARIABLE) {
    tick(frameSeconds);
    return 1;
  }

  accumulator += frameSeconds;
  int ticks = 0;
  while (accumulator >= currentConfig.FixedTimestep && ticks < currentConfig.MaxTicksPerFrame) {
    tick(currentConfig.FixedTimestep);
    accumulator -= currentConfig.FixedTimestep;
    ++ticks;
  }
  if (accumulator >= currentConfig.FixedTimestep) {
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "ECSSimulator: " << accumulator
              << "s of simulation time carried over, running behind real time\n");
  }
  return ticks;
}

int ECSSimulator::advanceFrame() {
  const auto now = Clock::now();
  double frameSeconds = 0.0;
  if (lastFrameTime) {
    frameSeconds = std::chrono::duration<double>(now - *lastFrameTime).count();
  }
  lastFrameTime = now;
  return advance(frameSeconds);
}

const CollisionManifold& ECSSimulator::getLastCollisions() const {
  return collisionSystem->getResolved();
}

// --- Scenarios ---

void ECSSimulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  scenarioPtr = std::move(scenario);
  if (scenarioPtr) {
    applyConfig(scenarioPtr->getConfig());
  }
}

void ECSSimulator::reset() {
  store.clearAll();

  if (scenarioPtr) {
    scenarioPtr->createBodies(store);
  }

  accumulator = 0.0;
  lastFrameTime.reset();
  stepFrame = false;
  tickCount = 0;
  simulatedTime = 0.0;

  std::cout << "ECSSimulator::reset() created " << store.size() << " bodies" << std::endl;
}
