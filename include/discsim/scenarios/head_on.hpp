/**
 * @file head_on.hpp
 * @brief Declaration of the HeadOnScenario class
 */

#pragma once

#include "discsim/scenarios/i_scenario.hpp"

/**
 * @struct HeadOnConfig
 * @brief Two equal bodies approaching along the horizontal centre line
 */
struct HeadOnConfig {
    double separation = 300.0;  // initial centre-to-centre distance
    double speed = 120.0;       // each body's speed towards the other
    double mass = 10.0;
    double radius = 25.0;
};

/**
 * @class HeadOnScenario
 *
 * Gravity off and perfectly elastic, so the bodies swap velocities on
 * impact and bounce between the side walls.
 */
class HeadOnScenario : public IScenario {
public:
    HeadOnScenario() = default;
    explicit HeadOnScenario(const HeadOnConfig& config) : scenarioConfig(config) {}
    ~HeadOnScenario() override = default;

    SystemConfig getConfig() const override;
    void createBodies(BodyStore &store) const override;

private:
    HeadOnConfig scenarioConfig;
};
