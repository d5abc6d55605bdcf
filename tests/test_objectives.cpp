#include <gtest/gtest.h>
#include <Eigen/Dense>
#include "../src/control/types.hpp"
#include "../src/control/integrator.hpp"
#include "../src/control/objectives.hpp"
#include "../src/control/errors.hpp"
#include <cmath>

using namespace evasion_control;

class ObjectivesTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot_.aircraft = AircraftState(Vec2(0.0, 0.0), Vec2(10.0, 0.0), 20.0, 5.0);
        snapshot_.target = TargetState(Vec2(100.0, 0.0));
        snapshot_.time_step = 1.0;
        snapshot_.horizon = 4;

        zero_plan_ = Eigen::VectorXd::Zero(2 * snapshot_.horizon);
    }

    Snapshot snapshot_;
    Eigen::VectorXd zero_plan_;
};

// Test the shared rollout
TEST_F(ObjectivesTest, IntegrateStepSemiImplicit) {
    AircraftState next = integrateStep(snapshot_.aircraft, Vec2(0.0, 5.0), 1.0);

    EXPECT_NEAR(next.velocity.x(), 10.0, 1e-12);
    EXPECT_NEAR(next.velocity.y(), 5.0, 1e-12);
    EXPECT_NEAR(next.position.x(), 10.0, 1e-12);
    EXPECT_NEAR(next.position.y(), 5.0, 1e-12);
    EXPECT_EQ(next.max_speed, snapshot_.aircraft.max_speed);
}

TEST_F(ObjectivesTest, IntegrateStepClampsSpeed) {
    AircraftState fast(Vec2::Zero(), Vec2(18.0, 0.0), 20.0, 5.0);

    AircraftState next = integrateStep(fast, Vec2(5.0, 0.0), 1.0);

    EXPECT_NEAR(next.velocity.norm(), 20.0, 1e-12);
    EXPECT_NEAR(next.position.x(), 20.0, 1e-12);

    Vec2 effective = effectiveAcceleration(fast, Vec2(5.0, 0.0), 1.0);
    EXPECT_NEAR(effective.x(), 2.0, 1e-12);
    EXPECT_NEAR(effective.y(), 0.0, 1e-12);
}

TEST_F(ObjectivesTest, RolloutLength) {
    Trajectory trajectory = rollout(snapshot_, zero_plan_);

    EXPECT_EQ(trajectory.ticks(), 4);
    EXPECT_NEAR(trajectory.positions.back().x(), 40.0, 1e-12);
    EXPECT_EQ(rollout(snapshot_, zero_plan_, 1).ticks(), 1);
}

TEST_F(ObjectivesTest, PredictThreatPathsSkipsInactive) {
    snapshot_.threats.emplace_back(Vec2(50.0, 0.0), Vec2(-1.0, 0.0), 10.0);
    snapshot_.threats.emplace_back(Vec2(0.0, 50.0), Vec2(0.0, -1.0), 10.0, false);

    auto paths = predictThreatPaths(snapshot_, 2);

    ASSERT_EQ(paths.size(), 3u);
    ASSERT_EQ(paths[2].size(), 1u);
    EXPECT_NEAR(paths[2][0].x(), 30.0, 1e-12);
}

// Test the strategies
TEST_F(ObjectivesTest, FuelScoreIsControlEffortPlusTargetTerm) {
    auto fuel = createObjective(ObjectiveKind::FUEL, 0.0);
    Eigen::VectorXd plan = zero_plan_;
    plan(0) = 3.0;
    plan(1) = 4.0;
    plan(6) = 1.0;

    EXPECT_NEAR(fuel->score(snapshot_, plan), 26.0, 1e-12);
    EXPECT_NEAR(fuel->score(snapshot_, zero_plan_), 0.0, 1e-12);
}

TEST_F(ObjectivesTest, TargetTermUsesFinalPosition) {
    auto fuel = createObjective(ObjectiveKind::FUEL, 2.0);

    // Final position x = 40, target 60 m away
    double expected = 2.0 * (std::sqrt(60.0 * 60.0 + 1e-4) - 1e-2);
    EXPECT_NEAR(fuel->score(snapshot_, zero_plan_), expected, 1e-9);
}

TEST_F(ObjectivesTest, TargetTermFollowsMovingTarget) {
    snapshot_.target = TargetState(Vec2(100.0, 0.0), Vec2(-15.0, 0.0));
    auto fuel = createObjective(ObjectiveKind::FUEL, 1.0);

    // Target extrapolated to x = 40 at the end of the horizon
    EXPECT_NEAR(fuel->score(snapshot_, zero_plan_), 0.0, 1e-12);
}

TEST_F(ObjectivesTest, SeparationTermsWithoutThreats) {
    auto min_distance = createObjective(ObjectiveKind::MIN_DISTANCE, 0.0);
    auto next_distance = createObjective(ObjectiveKind::NEXT_DISTANCE, 0.0);

    EXPECT_EQ(min_distance->score(snapshot_, zero_plan_), 0.0);
    EXPECT_EQ(next_distance->score(snapshot_, zero_plan_), 0.0);
}

TEST_F(ObjectivesTest, MinDistanceTakesWorstTick) {
    // Stationary threat at x = 25: the aircraft passes 10, 20, 30, 40
    snapshot_.threats.emplace_back(Vec2(25.0, 0.0), Vec2::Zero(), 0.0);
    auto min_distance = createObjective(ObjectiveKind::MIN_DISTANCE, 0.0);
    auto next_distance = createObjective(ObjectiveKind::NEXT_DISTANCE, 0.0);

    EXPECT_NEAR(min_distance->score(snapshot_, zero_plan_), -5.0, 1e-12);
    EXPECT_NEAR(next_distance->score(snapshot_, zero_plan_), -15.0, 1e-12);
}

TEST_F(ObjectivesTest, NextDistanceIgnoresLaterTicks) {
    snapshot_.threats.emplace_back(Vec2(25.0, 0.0), Vec2::Zero(), 0.0);
    auto next_distance = createObjective(ObjectiveKind::NEXT_DISTANCE, 0.0);

    Eigen::VectorXd plan = zero_plan_;
    plan.tail(6).setConstant(5.0);

    EXPECT_EQ(next_distance->score(snapshot_, plan), next_distance->score(snapshot_, zero_plan_));
}

TEST_F(ObjectivesTest, MinimumSeparationRange) {
    snapshot_.threats.emplace_back(Vec2(25.0, 0.0), Vec2::Zero(), 0.0);
    Trajectory trajectory = rollout(snapshot_, zero_plan_);
    auto paths = predictThreatPaths(snapshot_, trajectory.ticks());

    EXPECT_NEAR(minimumSeparation(trajectory, paths, 1, 4), 5.0, 1e-12);
    EXPECT_NEAR(minimumSeparation(trajectory, paths, 3, 4), 5.0, 1e-12);
    EXPECT_NEAR(minimumSeparation(trajectory, paths, 4, 4), 15.0, 1e-12);
    EXPECT_TRUE(std::isinf(minimumSeparation(trajectory, {}, 1, 4)));
}

TEST_F(ObjectivesTest, ObservedTicks) {
    EXPECT_EQ(observedTicks(ObjectiveKind::FUEL, 5), 5);
    EXPECT_EQ(observedTicks(ObjectiveKind::MIN_DISTANCE, 5), 5);
    EXPECT_EQ(observedTicks(ObjectiveKind::NEXT_DISTANCE, 5), 1);
}

TEST_F(ObjectivesTest, FactoryKinds) {
    EXPECT_EQ(createObjective(ObjectiveKind::FUEL, 1.0)->kind(), ObjectiveKind::FUEL);
    EXPECT_EQ(createObjective(ObjectiveKind::MIN_DISTANCE, 1.0)->kind(), ObjectiveKind::MIN_DISTANCE);
    EXPECT_EQ(createObjective(ObjectiveKind::NEXT_DISTANCE, 0.5)->getTargetWeight(), 0.5);
    EXPECT_THROW(createObjective(ObjectiveKind::FUEL, -1.0), InvalidArgument);
}
