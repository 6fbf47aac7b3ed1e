/**
 * @file drop_ball.hpp
 * @brief Declaration of the DropBallScenario class
 */

#pragma once

#include "discsim/scenarios/i_scenario.hpp"

/**
 * @struct DropBallConfig
 * @brief The single demonstration body dropped at start-up
 */
struct DropBallConfig {
    double startX = 400.0;
    double startY = 50.0;
    double mass = 10.0;
    double radius = 20.0;
    Components::Color color{0, 0, 255};
};

/**
 * @class DropBallScenario
 *
 * One body released from rest near the top of the default world.
 */
class DropBallScenario : public IScenario {
public:
    DropBallScenario() = default;
    explicit DropBallScenario(const DropBallConfig& config) : scenarioConfig(config) {}
    ~DropBallScenario() override = default;

    SystemConfig getConfig() const override;
    void createBodies(BodyStore &store) const override;

private:
    DropBallConfig scenarioConfig;
};
