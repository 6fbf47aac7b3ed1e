/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems in the disc simulation
 */

#pragma once

#include <entt/entt.hpp>
#include "discsim/core/system_config.hpp"
#include "discsim/systems/systems.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Every system sees the same SystemConfig; the simulator pushes a fresh copy
 * whenever a parameter changes, so a change made between ticks is visible
 * in full from the next tick.
 */
class ISystem {
protected:
    SystemConfig sysConfig;

public:
    virtual ~ISystem() = default;

    /**
     * @brief Advances the system by one tick
     *
     * @param registry EnTT registry holding the bodies
     * @param dt Tick duration in seconds
     */
    virtual void update(entt::registry& registry, double dt) = 0;

    /** @brief Which stage of the tick this system implements */
    virtual SystemType getType() const = 0;

    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Base for systems with tunables beyond the shared SystemConfig
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
