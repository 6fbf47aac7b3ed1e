#ifndef DISCSIM_I_SCENARIO_HPP
#define DISCSIM_I_SCENARIO_HPP

#include "discsim/core/body_store.hpp"
#include "discsim/core/system_config.hpp"

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getConfig() returning the parameters it is meant to run with
 *  - createBodies() that populates an (empty) store
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual SystemConfig getConfig() const = 0;

    virtual void createBodies(BodyStore &store) const = 0;
};

#endif // DISCSIM_I_SCENARIO_HPP
