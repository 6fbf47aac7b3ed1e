/**
 * @fileoverview sim_manager.cpp
 * @brief Implementation of SimManager.
 */

#include "discsim/arch/native/sim_manager.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <iostream>

#include "discsim/core/constants.hpp"
#include "discsim/core/profile.hpp"

namespace {

const std::array<Components::Color, 6> kPalette = {{
    Components::Color(0, 0, 255),
    Components::Color(220, 40, 40),
    Components::Color(30, 160, 60),
    Components::Color(240, 160, 0),
    Components::Color(140, 60, 200),
    Components::Color(20, 20, 20),
}};

}  // namespace

SimManager& SimManager::getInstance() {
  static SimManager instance;
  return instance;
}

SimManager::SimManager()
    : renderer(static_cast<unsigned int>(SimulatorConstants::DefaultWorldWidth),
               static_cast<unsigned int>(SimulatorConstants::DefaultWorldHeight)),
      simulator(),
      scenarioManager(),
      running(true),
      newBodyRadius(20.0),
      newBodyMass(10.0),
      colorIndex(0),
      rng(static_cast<unsigned int>(std::time(nullptr)))
{
}

bool SimManager::init() {
  if (!renderer.init()) {
    std::cerr << "Renderer initialization failed." << std::endl;
    return false;
  }
  scenarioManager.buildScenarioList();
  selectScenario(SimulatorConstants::SimulationType::DROP_BALL);
  return true;
}

void SimManager::run() {
  if (!init()) {
    return;
  }

  timeSinceLastProfilerPrint = sf::Time::Zero;
  statsClock.restart();
  sf::Clock frameClock;

  running = true;
  while (running && renderer.getWindow().isOpen()) {
    timeSinceLastProfilerPrint += frameClock.restart();

    handleEvents();
    if (!running) {
      break;
    }

    // Advance by the wall-clock time since the previous frame.
    simulator.advanceFrame();

    render();
    frameCount++;

    if (statsClock.getElapsedTime() >= statsUpdateInterval) {
      float const elapsed = statsClock.restart().asSeconds();
      actualFPS = elapsed > 0 ? static_cast<float>(frameCount) / elapsed : 0.0f;
      frameCount = 0;
    }

    if (timeSinceLastProfilerPrint >= profilerPrintInterval) {
      Profiling::Profiler::printStats();
      Profiling::Profiler::reset();
      timeSinceLastProfilerPrint = sf::Time::Zero;
    }
  }

  renderer.getWindow().close();
}

void SimManager::handleEvents() {
  sf::RenderWindow& window = renderer.getWindow();

  sf::Event event;
  while (window.pollEvent(event)) {
    if (event.type == sf::Event::Closed) {
      running = false;
    } else if (event.type == sf::Event::KeyPressed) {
      handleKeyPressed(event.key.code);
    } else if (event.type == sf::Event::MouseButtonPressed &&
               event.mouseButton.button == sf::Mouse::Left) {
      addBodyAt(event.mouseButton.x, event.mouseButton.y);
    }
  }
}

void SimManager::handleKeyPressed(sf::Keyboard::Key key) {
  switch (key) {
    case sf::Keyboard::Escape:
      running = false;
      break;
    case sf::Keyboard::A:
      addBodyNearTop();
      break;
    case sf::Keyboard::C:
      simulator.clearAll();
      break;
    case sf::Keyboard::F:
      simulator.setFrictionEnabled(!simulator.getConfig().FrictionEnabled);
      logParameters();
      break;
    case sf::Keyboard::Up:
      simulator.setGravityMagnitude(simulator.getConfig().GravityMagnitude + 0.5);
      logParameters();
      break;
    case sf::Keyboard::Down:
      simulator.setGravityMagnitude(simulator.getConfig().GravityMagnitude - 0.5);
      logParameters();
      break;
    case sf::Keyboard::Right:
      simulator.setElasticity(simulator.getConfig().Elasticity + 0.05);
      logParameters();
      break;
    case sf::Keyboard::Left:
      simulator.setElasticity(simulator.getConfig().Elasticity - 0.05);
      logParameters();
      break;
    case sf::Keyboard::RBracket:
      newBodyRadius += 1.0;
      logParameters();
      break;
    case sf::Keyboard::LBracket:
      newBodyRadius = std::max(1.0, newBodyRadius - 1.0);
      logParameters();
      break;
    case sf::Keyboard::Equal:
      newBodyMass += 1.0;
      logParameters();
      break;
    case sf::Keyboard::Hyphen:
      newBodyMass = std::max(1.0, newBodyMass - 1.0);
      logParameters();
      break;
    case sf::Keyboard::K:
      colorIndex = (colorIndex + 1) % kPalette.size();
      break;
    case sf::Keyboard::P:
      simulator.togglePause();
      break;
    case sf::Keyboard::Space:
      if (simulator.isPaused()) {
        simulator.stepOnce();
      }
      break;
    case sf::Keyboard::R:
      simulator.reset();
      break;
    case sf::Keyboard::T:
      simulator.setStepMode(simulator.getConfig().Mode == StepMode::VARIABLE
                                ? StepMode::FIXED : StepMode::VARIABLE);
      logParameters();
      break;
    case sf::Keyboard::Num1:
      selectScenario(SimulatorConstants::SimulationType::DROP_BALL);
      break;
    case sf::Keyboard::Num2:
      selectScenario(SimulatorConstants::SimulationType::HEAD_ON);
      break;
    case sf::Keyboard::Num3:
      selectScenario(SimulatorConstants::SimulationType::BALL_PIT);
      break;
    default:
      break;
  }
}

void SimManager::addBodyAt(double x, double y) {
  simulator.addBody(Vector2D(x, y), Vector2D(), Vector2D(),
                    newBodyMass, newBodyRadius, kPalette[colorIndex]);
}

void SimManager::addBodyNearTop() {
  std::uniform_real_distribution<double> jitter(-50.0, 50.0);
  addBodyAt(400.0 + jitter(rng), 50.0);
}

void SimManager::selectScenario(SimulatorConstants::SimulationType scenario) {
  scenarioManager.setCurrentScenario(scenario);
  simulator.loadScenario(scenarioManager.createScenario(scenario));
  simulator.reset();
  simulator.setPaused(false);
  std::cout << "Loaded scenario " << SimulatorConstants::getScenarioName(scenario) << std::endl;
  logParameters();
}

void SimManager::render() {
  renderer.clear();
  auto bodies = simulator.bodies();
  renderer.renderBodies(bodies);
  renderer.renderOverlay(actualFPS, bodies.size(), simulator.getConfig(), simulator.isPaused(),
                         SimulatorConstants::getScenarioName(scenarioManager.getCurrentScenario()));
  renderer.present();
}

void SimManager::logParameters() const {
  const auto& cfg = simulator.getConfig();
  std::cout << "gravity=" << cfg.GravityMagnitude
            << " friction=" << (cfg.FrictionEnabled ? "on" : "off")
            << " elasticity=" << cfg.Elasticity
            << " step=" << (cfg.Mode == StepMode::FIXED ? "fixed" : "variable")
            << " | new body r=" << newBodyRadius << " m=" << newBodyMass << std::endl;
}
