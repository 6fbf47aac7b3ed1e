/**
 * @fileoverview sim_manager.hpp
 * @brief High-level controller for the native front-end.
 *        Owns the main loop, the window and the simulator.
 */

#pragma once

#include <random>
#include <SFML/System/Clock.hpp>
#include <SFML/System/Time.hpp>
#include <SFML/Window/Event.hpp>

#include "discsim/arch/native/renderer_native.hpp"
#include "discsim/core/scenario_manager.hpp"
#include "discsim/core/simulator.hpp"

/**
 * @class SimManager
 * @brief Translates input into core calls and advances the simulator once per frame.
 *        Implemented as a Singleton.
 */
class SimManager {
 public:
  SimManager(const SimManager&) = delete;
  SimManager& operator=(const SimManager&) = delete;
  SimManager(SimManager&&) = delete;
  SimManager& operator=(SimManager&&) = delete;

  static SimManager& getInstance();

  /** @brief Runs the main loop until the window closes. */
  void run();

  /**
   * @brief Opens the window and loads the initial scenario.
   * @return true on success, false otherwise.
   */
  bool init();

  void selectScenario(SimulatorConstants::SimulationType scenario);

  /** @brief Adds a body with the current radius/mass/colour settings. */
  void addBodyAt(double x, double y);

  /** @brief Adds a body at x = 400 +- 50, y = 50. */
  void addBodyNearTop();

 private:
  SimManager();
  ~SimManager() = default;

  void handleEvents();
  void handleKeyPressed(sf::Keyboard::Key key);
  void render();
  void logParameters() const;

  Renderer renderer;
  ECSSimulator simulator;
  ScenarioManager scenarioManager;

  bool running;

  // Settings for new bodies
  double newBodyRadius;
  double newBodyMass;
  std::size_t colorIndex;
  std::default_random_engine rng;

  // Stats and periodic profiler output
  sf::Clock statsClock;
  unsigned int frameCount = 0;
  float actualFPS = 0.0f;
  sf::Time timeSinceLastProfilerPrint;
  const sf::Time statsUpdateInterval = sf::seconds(0.5f);
  const sf::Time profilerPrintInterval = sf::seconds(10.f);
};
