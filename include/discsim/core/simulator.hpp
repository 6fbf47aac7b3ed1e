/**
 * @file simulator.hpp
 * @brief Step driver: owns the bodies, the parameters and the ordered systems.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "discsim/core/body_store.hpp"
#include "discsim/core/system_config.hpp"
#include "discsim/scenarios/i_scenario.hpp"
#include "discsim/systems/collision/collision_data.hpp"
#include "discsim/systems/i_system.hpp"

namespace Systems {
class CollisionSystem;
}

/**
 * @class ECSSimulator
 * @brief Runs Integrator -> Collision -> Boundary over the body store.
 *
 * Single-threaded. A tick runs to completion; body and parameter changes
 * made between ticks are seen in full by the next one.
 */
class ECSSimulator {
public:
    ECSSimulator();
    explicit ECSSimulator(const SystemConfig& config);
    ~ECSSimulator();

    ECSSimulator(const ECSSimulator&) = delete;
    ECSSimulator& operator=(const ECSSimulator&) = delete;

    // --- Bodies ---

    Components::BodyId addBody(const BodyDefinition& def);
    Components::BodyId addBody(const Vector2D& position,
                               const Vector2D& velocity,
                               const Vector2D& acceleration,
                               double mass,
                               double radius,
                               const Components::Color& color);

    void clearAll();

    /**
     * @brief Per-frame read access for rendering, in id order
     */
    std::vector<BodySnapshot> bodies() const;

    BodyStore& getBodyStore() { return store; }
    const BodyStore& getBodyStore() const { return store; }

    // --- Parameters ---

    /**
     * @brief Replaces every parameter and forwards them to all systems
     */
    void applyConfig(const SystemConfig& cfg);
    const SystemConfig& getConfig() const { return currentConfig; }

    void setGravityMagnitude(double magnitude);
    void setFrictionEnabled(bool enabled);
    void setElasticity(double elasticity);
    void setWorldBounds(double width, double height);
    void setStepMode(StepMode mode);

    // --- Stepping ---

    /**
     * @brief Runs exactly one tick of length dt
     */
    void tick(double dt);

    /**
     * @brief Advances by one rendered frame of the given length
     *
     * VARIABLE mode runs a single tick of frameSeconds. FIXED mode adds the
     * frame to an accumulator and runs up to MaxTicksPerFrame ticks of
     * FixedTimestep, carrying any remainder. While paused nothing runs
     * unless stepOnce() was requested, which runs one FixedTimestep tick.
     *
     * @return number of ticks run
     */
    int advance(double frameSeconds);

    /**
     * @brief advance() with the wall-clock time since the previous call
     *
     * The first call after construction or reset() sees a delta of zero.
     */
    int advanceFrame();

    void setPaused(bool value) { paused = value; }
    bool isPaused() const { return paused; }
    void togglePause() { paused = !paused; }
    void stepOnce() { stepFrame = true; }

    std::uint64_t getTickCount() const { return tickCount; }
    double getSimulatedTime() const { return simulatedTime; }

    /**
     * @brief Contacts resolved by the most recent tick
     */
    const CollisionManifold& getLastCollisions() const;

    const std::vector<std::unique_ptr<Systems::ISystem>>& getSystems() const { return systems; }

    // --- Scenarios ---

    /**
     * @brief Takes ownership of a scenario and applies its parameters
     *
     * Bodies are not touched until reset().
     */
    void loadScenario(std::unique_ptr<IScenario> scenario);

    /**
     * @brief Clears the store and recreates the loaded scenario's bodies
     *
     * Parameters changed since loadScenario() are kept.
     */
    void reset();

private:
    void createSystems();
    void pushConfig();

    using Clock = std::chrono::steady_clock;

    BodyStore store;
    SystemConfig currentConfig;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::CollisionSystem* collisionSystem = nullptr;  // owned by systems
    std::unique_ptr<IScenario> scenarioPtr;

    std::optional<Clock::time_point> lastFrameTime;
    double accumulator = 0.0;
    bool paused = false;
    bool stepFrame = false;
    std::uint64_t tickCount = 0;
    double simulatedTime = 0.0;
};
