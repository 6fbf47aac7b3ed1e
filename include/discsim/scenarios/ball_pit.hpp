/**
 * @file ball_pit.hpp
 * @brief Declaration of the BallPitScenario class
 */

#pragma once

#include <cstdint>
#include "discsim/scenarios/i_scenario.hpp"

/**
 * @struct BallPitConfig
 * @brief Configuration parameters specific to the ball pit scenario
 */
struct BallPitConfig {
    int bodyCount = 40;
    double radiusMin = 8.0;
    double radiusMax = 24.0;
    double density = 0.01;         // mass = density * pi * r^2
    double spawnBandHeight = 200.0; // bodies start in the top band of the world
    double maxInitialSpeed = 60.0;
    std::uint32_t seed = 1234;      // fixed so a reset reproduces the same pit
};

/**
 * @class BallPitScenario
 *
 * A crowd of randomly sized, randomly coloured bodies dropped into the
 * world. The collision pass is O(n^2), so keep bodyCount modest.
 */
class BallPitScenario : public IScenario {
public:
    BallPitScenario() = default;
    explicit BallPitScenario(const BallPitConfig& config) : scenarioConfig(config) {}
    ~BallPitScenario() override = default;

    SystemConfig getConfig() const override;
    void createBodies(BodyStore &store) const override;

private:
    BallPitConfig scenarioConfig;
};
