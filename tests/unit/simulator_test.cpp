#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include "discsim/core/debug.hpp"
#include "discsim/core/simulator.hpp"
#include "discsim/scenarios/drop_ball.hpp"
#include "discsim/scenarios/head_on.hpp"

namespace {
const double kDt = 1.0 / 60.0;
}

class SimulatorTest : public ::testing::Test {
protected:
    ECSSimulator sim;

    Components::BodyId addBody(double x, double y, double vx = 0.0, double vy = 0.0,
                               double mass = 10.0, double radius = 20.0) {
        return sim.addBody(Vector2D(x, y), Vector2D(vx, vy), Vector2D(0.0, 0.0),
                           mass, radius, Components::Color(0, 0, 255));
    }

    BodySnapshot body(Components::BodyId id) { return *sim.getBodyStore().find(id); }

    bool allContained() const {
        const auto& cfg = sim.getConfig();
        for (const auto& b : sim.bodies()) {
            if (b.position.x - b.radius < -1e-9 || b.position.x + b.radius > cfg.WorldWidth + 1e-9 ||
                b.position.y - b.radius < -1e-9 || b.position.y + b.radius > cfg.WorldHeight + 1e-9) {
                return false;
            }
        }
        return true;
    }
};

TEST_F(SimulatorTest, DefaultParameters) {
    const auto& cfg = sim.getConfig();
    EXPECT_DOUBLE_EQ(cfg.WorldWidth, 800.0);
    EXPECT_DOUBLE_EQ(cfg.WorldHeight, 600.0);
    EXPECT_DOUBLE_EQ(cfg.GravityMagnitude, 9.8);
    EXPECT_TRUE(cfg.FrictionEnabled);
    EXPECT_DOUBLE_EQ(cfg.Elasticity, 0.7);
    EXPECT_EQ(cfg.Mode, StepMode::VARIABLE);
    EXPECT_FALSE(sim.isPaused());
}

TEST_F(SimulatorTest, SystemsRunInOrder) {
    const auto& systems = sim.getSystems();
    ASSERT_EQ(systems.size(), 3u);
    EXPECT_EQ(systems[0]->getType(), Systems::SystemType::INTEGRATOR);
    EXPECT_EQ(systems[1]->getType(), Systems::SystemType::COLLISION);
    EXPECT_EQ(systems[2]->getType(), Systems::SystemType::BOUNDARY);
}

TEST_F(SimulatorTest, AddAndClearBodies) {
    auto a = addBody(100.0, 100.0);
    auto b = addBody(300.0, 100.0);
    EXPECT_NE(a, b);
    EXPECT_EQ(sim.bodies().size(), 2u);

    sim.clearAll();
    EXPECT_TRUE(sim.bodies().empty());

    sim.tick(kDt);
    EXPECT_TRUE(sim.bodies().empty());
}

TEST_F(SimulatorTest, EmptyWorldTicks) {
    sim.tick(kDt);
    EXPECT_EQ(sim.getTickCount(), 1u);
    EXPECT_TRUE(sim.getLastCollisions().empty());
}

TEST_F(SimulatorTest, ParameterChangesApplyToNextTick) {
    auto id = addBody(400.0, 300.0);

    sim.setGravityMagnitude(0.0);
    sim.tick(kDt);
    EXPECT_DOUBLE_EQ(body(id).velocity.y, 0.0);

    sim.setGravityMagnitude(-6.0);
    sim.tick(0.5);
    EXPECT_NEAR(body(id).velocity.y, -3.0, 1e-12);
}

TEST_F(SimulatorTest, ElasticityChangeReachesBoundary) {
    sim.setGravityMagnitude(0.0);
    sim.setElasticity(1.0);
    auto id = addBody(400.0, 575.0, 0.0, 600.0);

    sim.tick(kDt);

    EXPECT_DOUBLE_EQ(body(id).position.y, 580.0);
    EXPECT_NEAR(body(id).velocity.y, -600.0, 1e-9);
}

TEST_F(SimulatorTest, WorldBoundsChangeReachesBoundary) {
    sim.setGravityMagnitude(0.0);
    sim.setWorldBounds(400.0, 300.0);
    auto id = addBody(500.0, 250.0);

    sim.tick(kDt);

    EXPECT_DOUBLE_EQ(body(id).position.x, 380.0);
    EXPECT_DOUBLE_EQ(body(id).position.y, 250.0);
}

TEST_F(SimulatorTest, FrictionToggleReachesIntegrator) {
    sim.setGravityMagnitude(0.0);
    auto id = addBody(400.0, 580.0, 10.0, 0.0);

    sim.setFrictionEnabled(false);
    sim.tick(0.0);
    EXPECT_DOUBLE_EQ(body(id).velocity.x, 10.0);

    sim.setFrictionEnabled(true);
    sim.tick(0.0);
    EXPECT_NEAR(body(id).velocity.x, 9.0, 1e-12);
}

TEST_F(SimulatorTest, DroppedBallComesToRestOnFloor) {
    sim.loadScenario(std::make_unique<DropBallScenario>());
    sim.reset();
    ASSERT_EQ(sim.bodies().size(), 1u);
    const auto id = sim.bodies().front().id;

    std::vector<double> lastSpeeds;
    for (int i = 0; i < 7200; ++i) {
        sim.tick(kDt);
        ASSERT_TRUE(allContained()) << "tick " << i;
        lastSpeeds.push_back(body(id).velocity.y);
    }

    // The floor contact settles into a two-tick cycle: one tick at rest and
    // one tick carrying the gravity gained since, reflected.
    const double g = sim.getConfig().GravityMagnitude;
    const double e = sim.getConfig().Elasticity;
    const auto rest = body(id);
    EXPECT_NEAR(rest.position.y, 580.0, 1e-9);
    EXPECT_NEAR(rest.position.x, 400.0, 1e-9);
    EXPECT_LE(std::abs(rest.velocity.y), e * g * kDt + 1e-9);

    const double prev = lastSpeeds[lastSpeeds.size() - 2];
    const double last = lastSpeeds.back();
    EXPECT_TRUE(prev == 0.0 || last == 0.0);
}

TEST_F(SimulatorTest, CrowdStaysContained) {
    sim.setElasticity(0.9);
    for (int i = 0; i < 20; ++i) {
        addBody(40.0 + 35.0 * i, 100.0 + 10.0 * (i % 5), 50.0 * ((i % 3) - 1), -20.0 * (i % 4), 5.0 + i, 15.0);
    }

    for (int i = 0; i < 1200; ++i) {
        sim.tick(kDt);
        ASSERT_TRUE(allContained()) << "tick " << i;
    }
    for (const auto& b : sim.bodies()) {
        EXPECT_TRUE(b.position.isFinite());
        EXPECT_TRUE(b.velocity.isFinite());
    }
}

TEST_F(SimulatorTest, HeadOnScenarioExchangesVelocities) {
    sim.loadScenario(std::make_unique<HeadOnScenario>());
    sim.reset();
    auto snap = sim.bodies();
    ASSERT_EQ(snap.size(), 2u);
    const auto left = snap[0].id;
    const auto right = snap[1].id;

    bool collided = false;
    for (int i = 0; i < 120 && !collided; ++i) {
        sim.tick(kDt);
        collided = !sim.getLastCollisions().empty();
    }

    ASSERT_TRUE(collided);
    EXPECT_NEAR(body(left).velocity.x, -120.0, 1e-9);
    EXPECT_NEAR(body(right).velocity.x, 120.0, 1e-9);
}

// --- Stepping ---

TEST_F(SimulatorTest, VariableModeRunsOneTickPerFrame) {
    EXPECT_EQ(sim.advance(0.1), 1);
    EXPECT_EQ(sim.advance(0.001), 1);
    EXPECT_EQ(sim.getTickCount(), 2u);
    EXPECT_NEAR(sim.getSimulatedTime(), 0.101, 1e-12);
}

TEST_F(SimulatorTest, FixedModeAccumulatesFrameTime) {
    SystemConfig cfg;
    cfg.Mode = StepMode::FIXED;
    cfg.FixedTimestep = 0.25;
    sim.applyConfig(cfg);

    EXPECT_EQ(sim.advance(0.625), 2);   // 0.125 carried
    EXPECT_EQ(sim.advance(0.125), 1);
    EXPECT_EQ(sim.advance(0.125), 0);
    EXPECT_EQ(sim.getTickCount(), 3u);
    EXPECT_DOUBLE_EQ(sim.getSimulatedTime(), 0.75);
}

TEST_F(SimulatorTest, FixedModeCapsTicksPerFrame) {
    SystemConfig cfg;
    cfg.Mode = StepMode::FIXED;
    cfg.FixedTimestep = 0.25;
    cfg.MaxTicksPerFrame = 5;
    sim.applyConfig(cfg);

    EXPECT_EQ(sim.advance(2.0), 5);
    // The rest is carried into later frames.
    EXPECT_EQ(sim.advance(0.0), 3);
    EXPECT_EQ(sim.advance(0.0), 0);
}

TEST_F(SimulatorTest, SwitchingStepModeDropsAccumulatedTime) {
    SystemConfig cfg;
    cfg.Mode = StepMode::FIXED;
    cfg.FixedTimestep = 0.25;
    sim.applyConfig(cfg);

    EXPECT_EQ(sim.advance(0.125), 0);
    sim.setStepMode(StepMode::VARIABLE);
    sim.setStepMode(StepMode::FIXED);
    EXPECT_EQ(sim.advance(0.125), 0);
}

TEST_F(SimulatorTest, PausedSimulationDoesNotAdvance) {
    auto id = addBody(400.0, 300.0);
    sim.setPaused(true);

    EXPECT_EQ(sim.advance(0.5), 0);
    EXPECT_EQ(sim.getTickCount(), 0u);
    EXPECT_DOUBLE_EQ(body(id).position.y, 300.0);

    sim.togglePause();
    EXPECT_FALSE(sim.isPaused());
    EXPECT_EQ(sim.advance(0.5), 1);
}

TEST_F(SimulatorTest, StepOnceRunsOneFixedTickWhilePaused) {
    sim.setPaused(true);
    sim.stepOnce();

    EXPECT_EQ(sim.advance(0.5), 1);
    EXPECT_DOUBLE_EQ(sim.getSimulatedTime(), sim.getConfig().FixedTimestep);
    EXPECT_EQ(sim.advance(0.5), 0);
    EXPECT_EQ(sim.getTickCount(), 1u);
}

TEST_F(SimulatorTest, FirstFrameHasZeroDelta) {
    auto id = addBody(400.0, 300.0);

    EXPECT_EQ(sim.advanceFrame(), 1);
    EXPECT_DOUBLE_EQ(sim.getSimulatedTime(), 0.0);
    EXPECT_DOUBLE_EQ(body(id).position.y, 300.0);

    sim.advanceFrame();
    EXPECT_EQ(sim.getTickCount(), 2u);
    EXPECT_GE(sim.getSimulatedTime(), 0.0);
}

TEST_F(SimulatorTest, ResetRecreatesScenarioBodies) {
    sim.loadScenario(std::make_unique<DropBallScenario>());
    sim.reset();
    const auto firstId = sim.bodies().front().id;

    addBody(100.0, 100.0);
    for (int i = 0; i < 10; ++i) {
        sim.tick(kDt);
    }
    sim.reset();

    auto snap = sim.bodies();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_DOUBLE_EQ(snap[0].position.x, 400.0);
    EXPECT_DOUBLE_EQ(snap[0].position.y, 50.0);
    EXPECT_DOUBLE_EQ(snap[0].velocity.y, 0.0);
    EXPECT_TRUE(firstId < snap[0].id);
    EXPECT_EQ(sim.getTickCount(), 0u);
    EXPECT_DOUBLE_EQ(sim.getSimulatedTime(), 0.0);
}

TEST_F(SimulatorTest, LoadScenarioAppliesItsParameters) {
    sim.loadScenario(std::make_unique<HeadOnScenario>());

    EXPECT_DOUBLE_EQ(sim.getConfig().GravityMagnitude, 0.0);
    EXPECT_DOUBLE_EQ(sim.getConfig().Elasticity, 1.0);
    EXPECT_FALSE(sim.getConfig().FrictionEnabled);
    EXPECT_TRUE(sim.bodies().empty());
}

TEST_F(SimulatorTest, ResetKeepsChangedParameters) {
    sim.loadScenario(std::make_unique<DropBallScenario>());
    sim.setGravityMagnitude(3.0);
    sim.reset();

    EXPECT_DOUBLE_EQ(sim.getConfig().GravityMagnitude, 3.0);
}

TEST_F(SimulatorTest, TickCountersDescribeTheLastTick) {
    sim.setGravityMagnitude(0.0);
    addBody(100.0, 100.0, 5.0, 0.0);
    addBody(130.0, 100.0, -5.0, 0.0);
    addBody(790.0, 300.0, 10.0, 0.0);

    sim.tick(kDt);

    EXPECT_EQ(DebugStats::bodiesIntegrated(), 3u);
    EXPECT_EQ(DebugStats::pairsTested(), 3u);
    EXPECT_EQ(DebugStats::collisionsResolved(), 1u);
    EXPECT_EQ(DebugStats::boundaryContacts(), 1u);
    EXPECT_EQ(sim.getLastCollisions().size(), 1u);
}
