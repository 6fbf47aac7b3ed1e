#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "discsim/core/scenario_manager.hpp"
#include "discsim/scenarios/ball_pit.hpp"
#include "discsim/scenarios/drop_ball.hpp"
#include "discsim/scenarios/head_on.hpp"

using SimulatorConstants::SimulationType;

class ScenarioTest : public ::testing::Test {
protected:
    ScenarioManager manager;
    BodyStore store;

    void SetUp() override { manager.buildScenarioList(); }
};

TEST_F(ScenarioTest, ListsEveryScenario) {
    const auto& list = manager.getScenarioList();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].first, SimulationType::DROP_BALL);
    EXPECT_EQ(list[0].second, "DROP_BALL");
    EXPECT_EQ(list[1].first, SimulationType::HEAD_ON);
    EXPECT_EQ(list[2].first, SimulationType::BALL_PIT);
    EXPECT_EQ(list[2].second, "BALL_PIT");
}

TEST_F(ScenarioTest, CurrentScenarioDefaultsToDropBall) {
    EXPECT_EQ(manager.getCurrentScenario(), SimulationType::DROP_BALL);
    manager.setCurrentScenario(SimulationType::BALL_PIT);
    EXPECT_EQ(manager.getCurrentScenario(), SimulationType::BALL_PIT);
}

TEST_F(ScenarioTest, CreatesEveryListedScenario) {
    for (const auto& entry : manager.getScenarioList()) {
        auto scenario = manager.createScenario(entry.first);
        ASSERT_NE(scenario, nullptr) << entry.second;
    }
    EXPECT_NE(dynamic_cast<DropBallScenario*>(manager.createScenario(SimulationType::DROP_BALL).get()), nullptr);
    EXPECT_NE(dynamic_cast<HeadOnScenario*>(manager.createScenario(SimulationType::HEAD_ON).get()), nullptr);
    EXPECT_NE(dynamic_cast<BallPitScenario*>(manager.createScenario(SimulationType::BALL_PIT).get()), nullptr);
}

TEST_F(ScenarioTest, UnknownTypeThrows) {
    EXPECT_THROW(manager.createScenario(static_cast<SimulationType>(99)), std::invalid_argument);
}

TEST_F(ScenarioTest, DropBallCreatesOneBodyAtRest) {
    DropBallScenario scenario;
    scenario.createBodies(store);

    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_DOUBLE_EQ(snap[0].position.x, 400.0);
    EXPECT_DOUBLE_EQ(snap[0].position.y, 50.0);
    EXPECT_DOUBLE_EQ(snap[0].velocity.x, 0.0);
    EXPECT_DOUBLE_EQ(snap[0].velocity.y, 0.0);
    EXPECT_DOUBLE_EQ(snap[0].mass, 10.0);
    EXPECT_DOUBLE_EQ(snap[0].radius, 20.0);
    EXPECT_EQ(snap[0].color, Components::Color(0, 0, 255));

    const SystemConfig cfg = scenario.getConfig();
    EXPECT_DOUBLE_EQ(cfg.GravityMagnitude, 9.8);
    EXPECT_DOUBLE_EQ(cfg.Elasticity, 0.7);
    EXPECT_TRUE(cfg.FrictionEnabled);
}

TEST_F(ScenarioTest, HeadOnBodiesApproachEachOther) {
    HeadOnScenario scenario;
    scenario.createBodies(store);

    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_DOUBLE_EQ(snap[0].position.y, snap[1].position.y);
    EXPECT_LT(snap[0].position.x, snap[1].position.x);
    EXPECT_GT(snap[0].velocity.x, 0.0);
    EXPECT_LT(snap[1].velocity.x, 0.0);
    EXPECT_DOUBLE_EQ(snap[0].velocity.x, -snap[1].velocity.x);
    EXPECT_GT(snap[1].position.x - snap[0].position.x, snap[0].radius + snap[1].radius);

    const SystemConfig cfg = scenario.getConfig();
    EXPECT_DOUBLE_EQ(cfg.GravityMagnitude, 0.0);
    EXPECT_DOUBLE_EQ(cfg.Elasticity, 1.0);
    EXPECT_FALSE(cfg.FrictionEnabled);
}

TEST_F(ScenarioTest, BallPitFitsInsideItsBand) {
    BallPitConfig pit;
    BallPitScenario scenario(pit);
    scenario.createBodies(store);

    const SystemConfig cfg = scenario.getConfig();
    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), static_cast<size_t>(pit.bodyCount));
    for (const auto& b : snap) {
        EXPECT_GE(b.radius, pit.radiusMin);
        EXPECT_LE(b.radius, pit.radiusMax);
        EXPECT_GT(b.mass, 0.0);
        EXPECT_GE(b.position.x - b.radius, -1e-9);
        EXPECT_LE(b.position.x + b.radius, cfg.WorldWidth + 1e-9);
        EXPECT_GE(b.position.y - b.radius, -1e-9);
        EXPECT_LE(b.position.y + b.radius, pit.spawnBandHeight + 1e-9);
        EXPECT_LE(std::abs(b.velocity.x), pit.maxInitialSpeed);
        EXPECT_LE(std::abs(b.velocity.y), pit.maxInitialSpeed);
    }
}

TEST_F(ScenarioTest, BallPitIsReproducible) {
    BallPitScenario scenario;
    BodyStore other;
    scenario.createBodies(store);
    scenario.createBodies(other);

    auto a = store.snapshot();
    auto b = other.snapshot();
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a[i].position.x, b[i].position.x);
        EXPECT_DOUBLE_EQ(a[i].position.y, b[i].position.y);
        EXPECT_DOUBLE_EQ(a[i].radius, b[i].radius);
        EXPECT_EQ(a[i].color, b[i].color);
    }
}

TEST_F(ScenarioTest, BallPitMassFollowsArea) {
    BallPitConfig pit;
    pit.bodyCount = 5;
    BallPitScenario scenario(pit);
    scenario.createBodies(store);

    const double pi = std::acos(-1.0);
    store.forEach([&](const BodySnapshot& b) {
        EXPECT_NEAR(b.mass, pit.density * pi * b.radius * b.radius, 1e-9);
    });
}
