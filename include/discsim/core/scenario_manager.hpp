/**
 * @fileoverview scenario_manager.hpp
 * @brief Maintains the list of available scenarios and creates scenario objects.
 */

#ifndef DISCSIM_SCENARIO_MANAGER_HPP
#define DISCSIM_SCENARIO_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "discsim/core/constants.hpp"
#include "discsim/scenarios/i_scenario.hpp"

/**
 * @class ScenarioManager
 * @brief Catalog of available scenarios and a factory to create them.
 */
class ScenarioManager {
 public:
  /**
   * @brief Builds an internal list of all available scenarios.
   */
  void buildScenarioList();

  const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
  getScenarioList() const;

  void setCurrentScenario(SimulatorConstants::SimulationType scenario);
  SimulatorConstants::SimulationType getCurrentScenario() const;

  /**
   * @brief Creates a new scenario object of the specified type.
   * @throws std::invalid_argument for a type with no scenario behind it.
   */
  std::unique_ptr<IScenario> createScenario(
      SimulatorConstants::SimulationType scenarioType) const;

 private:
  std::vector<std::pair<SimulatorConstants::SimulationType, std::string>> scenarioList;
  SimulatorConstants::SimulationType currentScenario =
      SimulatorConstants::SimulationType::DROP_BALL;
};

#endif  // DISCSIM_SCENARIO_MANAGER_HPP
