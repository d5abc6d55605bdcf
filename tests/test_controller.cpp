#include <gtest/gtest.h>
#include <Eigen/Dense>
#include "../src/control/controller.hpp"
#include "../src/control/integrator.hpp"
#include "../src/control/errors.hpp"
#include <cmath>
#include <limits>

using namespace evasion_control;

class ControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.objective = ObjectiveKind::FUEL;
        config_.horizon = 5;
        config_.time_step = 1.0;
        config_.max_accel = 5.0;
        config_.max_speed = 20.0;
        config_.target_weight = 1.0;
        config_.time_budget = 10.0;

        live_.aircraft = AircraftState(Vec2(0.0, 0.0), Vec2::Zero(), 20.0, 5.0);
        live_.target = TargetState(Vec2(10.0, 0.0));
    }

    ControllerConfig config_;
    LiveState live_;
};

TEST_F(ControllerTest, DefaultConfigIsValid) {
    ControllerConfig config;

    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.objective, ObjectiveKind::MIN_DISTANCE);
    EXPECT_EQ(config.horizon, 5);
    EXPECT_DOUBLE_EQ(config.time_step, 0.05);
}

TEST_F(ControllerTest, InvalidConfigRejected) {
    ControllerConfig bad = config_;
    bad.horizon = 0;
    EXPECT_THROW(EvasionController{bad}, InvalidArgument);

    bad = config_;
    bad.time_step = 0.0;
    EXPECT_THROW(EvasionController{bad}, InvalidArgument);

    bad = config_;
    bad.survival_radius = -1.0;
    EXPECT_THROW(EvasionController{bad}, InvalidArgument);

    bad = config_;
    bad.max_restarts = -3;
    EXPECT_THROW(EvasionController{bad}, InvalidArgument);

    bad = config_;
    bad.target_weight = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(EvasionController{bad}, InvalidArgument);
}

TEST_F(ControllerTest, SolverSettingsFollowConfig) {
    config_.survival_radius = 7.0;
    config_.max_restarts = 2;
    config_.max_iterations = 42;

    SolverSettings settings = config_.solverSettings();

    EXPECT_EQ(settings.survival_radius, 7.0);
    EXPECT_EQ(settings.max_restarts, 2);
    EXPECT_EQ(settings.max_iterations, 42);
    EXPECT_EQ(settings.time_budget, config_.time_budget);
}

TEST_F(ControllerTest, CaptureSnapshotCopiesLiveState) {
    live_.threats.emplace_back(Vec2(5.0, 5.0), Vec2(0.0, -1.0), 10.0);
    EvasionController controller(config_);

    Snapshot snapshot = controller.captureSnapshot(live_);
    live_.threats[0].position = Vec2(0.0, 0.0);

    EXPECT_EQ(snapshot.horizon, config_.horizon);
    EXPECT_EQ(snapshot.time_step, config_.time_step);
    ASSERT_EQ(snapshot.threats.size(), 1u);
    EXPECT_EQ(snapshot.threats[0].position, Vec2(5.0, 5.0));
}

TEST_F(ControllerTest, FuelApproachUnderRepeatedCalls) {
    auto controller = createEvasionController(config_);
    AircraftState aircraft = live_.aircraft;
    double distance = (live_.target.position - aircraft.position).norm();

    for (int tick = 0; tick < 5; ++tick) {
        LiveState live = live_;
        live.aircraft = aircraft;

        ControlDecision control = controller->nextAcceleration(live);
        EXPECT_LE(control.norm(), config_.max_accel + 1e-9);
        if (tick == 0) {
            EXPECT_GT(control.x(), 0.0);
            EXPECT_GT(control.x(), 0.9 * control.norm());
        }

        aircraft = integrateStep(aircraft, control, config_.time_step);
        double next_distance = (live_.target.position - aircraft.position).norm();
        EXPECT_LT(next_distance, distance) << "tick " << tick;
        distance = next_distance;
    }

    EXPECT_EQ(controller->tickCount(), 5);
    EXPECT_EQ(controller->degradedTickCount(), 0);
    EXPECT_TRUE(controller->hasWarmStart());
    EXPECT_FALSE(controller->lastReport().degraded);
}

TEST_F(ControllerTest, InfeasibleSnapshotFallsBack) {
    // Stationary threat 1 m ahead, 50 m survival radius out of reach
    config_.survival_radius = 50.0;
    config_.max_restarts = 0;
    config_.time_step = 0.05;
    live_.threats.emplace_back(Vec2(1.0, 0.0), Vec2::Zero(), 0.0);
    EvasionController controller(config_);

    ControlDecision control;
    ASSERT_NO_THROW(control = controller.nextAcceleration(live_));

    EXPECT_NEAR(control.x(), -config_.max_accel, 1e-9);
    EXPECT_NEAR(control.y(), 0.0, 1e-9);
    EXPECT_EQ(control, controller.fallbackAcceleration(controller.captureSnapshot(live_)));

    const TickReport& report = controller.lastReport();
    EXPECT_TRUE(report.degraded);
    EXPECT_FALSE(report.reason.empty());
    EXPECT_TRUE(std::isnan(report.score));
    EXPECT_EQ(controller.degradedTickCount(), 1);
    EXPECT_FALSE(controller.hasWarmStart());
}

TEST_F(ControllerTest, FallbackWithoutThreatsIsZero) {
    EvasionController controller(config_);
    Snapshot snapshot = controller.captureSnapshot(live_);

    EXPECT_EQ(controller.fallbackAcceleration(snapshot), ControlDecision::Zero());

    snapshot.threats.emplace_back(Vec2(3.0, 0.0), Vec2::Zero(), 0.0, false);
    EXPECT_EQ(controller.fallbackAcceleration(snapshot), ControlDecision::Zero());
}

TEST_F(ControllerTest, FallbackAvoidsMostImminentThreat) {
    EvasionController controller(config_);
    Snapshot snapshot = controller.captureSnapshot(live_);
    // Distant stationary threat and a closer-in-time fast one coming from above
    snapshot.threats.emplace_back(Vec2(-8.0, 0.0), Vec2::Zero(), 0.0);
    snapshot.threats.emplace_back(Vec2(0.0, 30.0), Vec2(0.0, -1.0), 50.0);

    ControlDecision control = controller.fallbackAcceleration(snapshot);

    EXPECT_NEAR(control.x(), 0.0, 1e-9);
    EXPECT_NEAR(control.y(), -config_.max_accel, 1e-9);
}

TEST_F(ControllerTest, FallbackRespectsSpeedLimit) {
    EvasionController controller(config_);
    live_.aircraft.velocity = Vec2(-18.0, 0.0);
    Snapshot snapshot = controller.captureSnapshot(live_);
    snapshot.threats.emplace_back(Vec2(5.0, 0.0), Vec2::Zero(), 0.0);

    ControlDecision control = controller.fallbackAcceleration(snapshot);

    Vec2 v_next = snapshot.aircraft.velocity + control * snapshot.time_step;
    EXPECT_LE(v_next.norm(), config_.max_speed + 1e-9);
    EXPECT_LE(control.norm(), config_.max_accel + 1e-9);
    EXPECT_LT(control.x(), 0.0);
}

TEST_F(ControllerTest, InvalidStatePropagates) {
    EvasionController controller(config_);

    LiveState bad = live_;
    bad.aircraft.position.x() = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(controller.nextAcceleration(bad), InvalidArgument);

    bad = live_;
    bad.aircraft.velocity = Vec2(30.0, 0.0);
    EXPECT_THROW(controller.nextAcceleration(bad), InvalidArgument);

    EXPECT_EQ(controller.tickCount(), 0);
}

TEST_F(ControllerTest, ImminentThreatsReported) {
    config_.danger_radius = 5.0;
    EvasionController controller(config_);
    // Reaches the danger radius after 2 s, within the 5 s horizon
    live_.threats.emplace_back(Vec2(0.0, 25.0), Vec2(0.0, -1.0), 10.0);
    // Flying away
    live_.threats.emplace_back(Vec2(0.0, -40.0), Vec2(0.0, -1.0), 10.0);

    controller.nextAcceleration(live_);

    EXPECT_EQ(controller.lastReport().imminent_threats, 1);
}

TEST_F(ControllerTest, ResetClearsState) {
    EvasionController controller(config_);
    controller.nextAcceleration(live_);
    ASSERT_TRUE(controller.hasWarmStart());

    controller.reset();

    EXPECT_FALSE(controller.hasWarmStart());
    EXPECT_EQ(controller.tickCount(), 0);
    EXPECT_EQ(controller.degradedTickCount(), 0);
    EXPECT_FALSE(controller.lastReport().degraded);
}

TEST_F(ControllerTest, HeadOnScenarioWithDefaultWeighting) {
    ControllerConfig config;
    config.objective = ObjectiveKind::MIN_DISTANCE;
    config.horizon = 5;
    config.time_step = 1.0;
    config.max_accel = 5.0;
    config.max_speed = 20.0;
    config.time_budget = 10.0;
    ASSERT_EQ(config.survival_radius, 0.0);

    live_.target = TargetState(Vec2(100.0, 0.0));
    live_.threats.emplace_back(Vec2(50.0, 0.0), Vec2(-10.0, 0.0), 10.0);
    EvasionController controller(config);

    ControlDecision control = controller.nextAcceleration(live_);

    EXPECT_FALSE(controller.lastReport().degraded);
    EXPECT_GT(std::abs(control.y()), 1e-3);
    EXPECT_LE(control.norm(), config.max_accel + 1e-9);

    Vec2 threat_next(40.0, 0.0);
    AircraftState next = integrateStep(live_.aircraft, control, config.time_step);
    EXPECT_GT((next.position - threat_next).norm(), 40.0);
}

TEST_F(ControllerTest, ConfiguredLimitsCapLiveLimits) {
    live_.aircraft.max_accel = 500.0;
    live_.aircraft.max_speed = 1000.0;
    EvasionController controller(config_);

    Snapshot snapshot = controller.captureSnapshot(live_);
    EXPECT_EQ(snapshot.aircraft.max_accel, config_.max_accel);
    EXPECT_EQ(snapshot.aircraft.max_speed, config_.max_speed);

    // Tighter live limits are kept
    LiveState tight = live_;
    tight.aircraft.max_accel = 2.0;
    EXPECT_EQ(controller.captureSnapshot(tight).aircraft.max_accel, 2.0);

    // Optimized tick
    ControlDecision control = controller.nextAcceleration(live_);
    EXPECT_FALSE(controller.lastReport().degraded);
    EXPECT_LE(control.norm(), config_.max_accel + 1e-9);

    // Fallback tick
    live_.threats.emplace_back(Vec2(1.0, 0.0), Vec2::Zero(), 0.0);
    config_.survival_radius = 50.0;
    config_.max_restarts = 0;
    config_.time_step = 0.05;
    EvasionController cornered(config_);
    control = cornered.nextAcceleration(live_);
    EXPECT_TRUE(cornered.lastReport().degraded);
    EXPECT_NEAR(control.norm(), config_.max_accel, 1e-9);
}

TEST_F(ControllerTest, ExhaustedTimeBudgetDegradesTick) {
    // The zero plan breaks the 2 m radius around a threat 1 m ahead
    config_.survival_radius = 2.0;
    config_.time_budget = 1e-9;
    live_.threats.emplace_back(Vec2(1.0, 0.0), Vec2::Zero(), 0.0);
    EvasionController controller(config_);

    ControlDecision control;
    ASSERT_NO_THROW(control = controller.nextAcceleration(live_));

    EXPECT_TRUE(controller.lastReport().degraded);
    EXPECT_EQ(controller.degradedTickCount(), 1);
    EXPECT_NEAR(control.x(), -config_.max_accel, 1e-9);
    EXPECT_NEAR(control.y(), 0.0, 1e-9);
}

TEST_F(ControllerTest, TargetSeekingHeadsForTarget) {
    TargetSeekingController pilot(config_);

    // Full acceleration from rest
    ControlDecision control = pilot.nextAcceleration(live_);
    EXPECT_NEAR(control.x(), config_.max_accel, 1e-12);
    EXPECT_NEAR(control.y(), 0.0, 1e-12);

    // Already closing at the desired rate
    live_.aircraft.position = Vec2(9.0, 0.0);
    live_.aircraft.velocity = Vec2(1.0, 0.0);
    EXPECT_NEAR(pilot.nextAcceleration(live_).norm(), 0.0, 1e-12);

    // Threats are ignored
    live_.threats.emplace_back(Vec2(9.5, 0.0), Vec2(-1.0, 0.0), 10.0);
    EXPECT_NEAR(pilot.nextAcceleration(live_).norm(), 0.0, 1e-12);
    EXPECT_EQ(pilot.degradedTickCount(), 0);
}

TEST_F(ControllerTest, TargetSeekingRespectsLimits) {
    live_.aircraft.max_accel = 500.0;
    live_.aircraft.velocity = Vec2(0.0, 19.0);
    live_.target = TargetState(Vec2(0.0, 1000.0));
    auto pilot = createTargetSeekingController(config_);

    ControlDecision control = pilot->nextAcceleration(live_);

    EXPECT_LE(control.norm(), config_.max_accel + 1e-9);
    Vec2 v_next = live_.aircraft.velocity + control * config_.time_step;
    EXPECT_LE(v_next.norm(), config_.max_speed + 1e-9);

    ControllerConfig bad = config_;
    bad.time_step = 0.0;
    EXPECT_THROW(TargetSeekingController{bad}, InvalidArgument);
}
