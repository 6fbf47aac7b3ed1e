/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include <stdexcept>
#include <vector>

#include "discsim/core/scenario_manager.hpp"
#include "discsim/scenarios/ball_pit.hpp"
#include "discsim/scenarios/drop_ball.hpp"
#include "discsim/scenarios/head_on.hpp"

void ScenarioManager::buildScenarioList() {
  scenarioList.clear();
  for (auto s : SimulatorConstants::getAllScenarios()) {
    scenarioList.emplace_back(s, SimulatorConstants::getScenarioName(s));
  }
}

const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
ScenarioManager::getScenarioList() const {
  return scenarioList;
}

void ScenarioManager::setCurrentScenario(SimulatorConstants::SimulationType scenario) {
  currentScenario = scenario;
}

SimulatorConstants::SimulationType ScenarioManager::getCurrentScenario() const {
  return currentScenario;
}

std::unique_ptr<IScenario> ScenarioManager::createScenario(
    SimulatorConstants::SimulationType scenarioType) const {
  switch (scenarioType) {
    case SimulatorConstants::SimulationType::DROP_BALL:
      return std::make_unique<DropBallScenario>();

    case SimulatorConstants::SimulationType::HEAD_ON:
      return std::make_unique<HeadOnScenario>();

    case SimulatorConstants::SimulationType::BALL_PIT:
      return std::make_unique<BallPitScenario>();
  }
  throw std::invalid_argument("ScenarioManager: unknown scenario type " +
                              std::to_string(static_cast<int>(scenarioType)));
}
