#include "controller.hpp"
#include "constraints.hpp"
#include "errors.hpp"
#include "integrator.hpp"
#include "threat_model.hpp"
#include "../utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace evasion_control {

namespace {

void requirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw InvalidArgument(std::string(name) + " must be positive and finite");
    }
}

void requireNonNegative(double value, const char* name) {
    if (!(value >= 0.0) || !std::isfinite(value)) {
        throw InvalidArgument(std::string(name) + " must be non-negative and finite");
    }
}

/**
 * @brief Previous plan advanced by one tick, zero acceleration appended
 */
Eigen::VectorXd shiftPlan(const Eigen::VectorXd& plan) {
    const int dim = utils::controlDim();
    Eigen::VectorXd shifted = Eigen::VectorXd::Zero(plan.size());
    if (plan.size() > dim) {
        shifted.head(plan.size() - dim) = plan.tail(plan.size() - dim);
    }
    return shifted;
}

} // namespace

// ControllerConfig implementation
void ControllerConfig::validate() const {
    if (horizon < 1) {
        throw InvalidArgument("horizon must be at least 1");
    }
    requirePositive(time_step, "time_step");
    requirePositive(max_accel, "max_accel");
    requirePositive(max_speed, "max_speed");
    requireNonNegative(survival_radius, "survival_radius");
    requireNonNegative(target_weight, "target_weight");
    requirePositive(solver_tolerance, "solver_tolerance");
    if (max_restarts < 0) {
        throw InvalidArgument("max_restarts must be non-negative");
    }
    requirePositive(time_budget, "time_budget");
    requireNonNegative(constraint_tolerance, "constraint_tolerance");
    if (max_iterations < 1) {
        throw InvalidArgument("max_iterations must be at least 1");
    }
    requireNonNegative(danger_radius, "danger_radius");
}

SolverSettings ControllerConfig::solverSettings() const {
    SolverSettings settings;
    settings.survival_radius = survival_radius;
    settings.tolerance = solver_tolerance;
    settings.constraint_tolerance = constraint_tolerance;
    settings.max_restarts = max_restarts;
    settings.max_iterations = max_iterations;
    settings.time_budget = time_budget;
    return settings;
}

// TargetSeekingController implementation
TargetSeekingController::TargetSeekingController(const ControllerConfig& config)
    : config_(config) {
    config_.validate();
}

ControlDecision TargetSeekingController::nextAcceleration(const LiveState& live) {
    AircraftState aircraft = live.aircraft;
    aircraft.max_accel = std::min(live.aircraft.max_accel, config_.max_accel);
    aircraft.max_speed = std::min(live.aircraft.max_speed, config_.max_speed);

    Snapshot snapshot;
    snapshot.aircraft = aircraft;
    snapshot.target = live.target;
    snapshot.time_step = config_.time_step;
    snapshot.horizon = 1;
    validateSnapshot(snapshot);

    const double dt = config_.time_step;
    Vec2 dv = utils::clampNorm(live.target.position - aircraft.position - aircraft.velocity,
                               aircraft.max_accel * dt);
    return effectiveAcceleration(aircraft, dv / dt, dt);
}

// EvasionController implementation
EvasionController::EvasionController(const ControllerConfig& config)
    : config_(config), tick_count_(0), degraded_count_(0) {
    config_.validate();
    objective_ = createObjective(config_.objective, config_.target_weight);
    optimizer_ = createTrajectoryOptimizer(config_.solverSettings());
    logger_ = logging::getLogger("evasion.controller");

    logger_->debug("Controller ready: objective={} horizon={} dt={} survival_radius={}",
                   utils::objectiveName(config_.objective), config_.horizon,
                   config_.time_step, config_.survival_radius);
}

Snapshot EvasionController::captureSnapshot(const LiveState& live) const {
    Snapshot snapshot;
    snapshot.aircraft = live.aircraft;
    // Configured limits cap whatever the live state carries; NaN stays NaN for validation
    snapshot.aircraft.max_accel = std::min(live.aircraft.max_accel, config_.max_accel);
    snapshot.aircraft.max_speed = std::min(live.aircraft.max_speed, config_.max_speed);
    snapshot.target = live.target;
    snapshot.threats = live.threats;
    snapshot.time_step = config_.time_step;
    snapshot.horizon = config_.horizon;
    return snapshot;
}

ControlDecision EvasionController::nextAcceleration(const LiveState& live) {
    Snapshot snapshot = captureSnapshot(live);
    validateSnapshot(snapshot);

    TickReport report;
    report.imminent_threats = countImminentThreats(snapshot);
    ++tick_count_;

    try {
        OptimizationResult result = optimizer_->solve(snapshot, *objective_, warm_start_);
        warm_start_ = shiftPlan(result.plan);

        report.control = result.control;
        report.score = result.score;
        logger_->debug("Tick {}: control=({:.3f}, {:.3f}) score={:.4f} starts={} iterations={} imminent={}",
                       tick_count_, result.control.x(), result.control.y(), result.score,
                       result.starts, result.iterations, report.imminent_threats);
    } catch (const OptimizationFailed& e) {
        warm_start_.reset();
        ++degraded_count_;

        report.control = fallbackAcceleration(snapshot);
        report.degraded = true;
        report.reason = e.what();
        report.score = std::numeric_limits<double>::quiet_NaN();
        logger_->warn("Tick {} degraded: {}; fallback=({:.3f}, {:.3f})",
                      tick_count_, e.what(), report.control.x(), report.control.y());
    }

    last_report_ = report;
    return report.control;
}

ControlDecision EvasionController::fallbackAcceleration(const Snapshot& snapshot) const {
    auto assessments = assessThreats(snapshot, config_.danger_radius);
    if (assessments.empty()) {
        return ControlDecision::Zero();
    }

    const ThreatAssessment& danger = assessments.front();
    const ThreatState& threat = snapshot.threats[danger.index];
    logger_->debug("Fallback threat {}: distance {:.2f} m, closest approach {:.2f} m at t{:+.2f} s",
                   danger.index, danger.distance, danger.closest_approach, danger.closest_approach_time);

    Vec2 away = snapshot.aircraft.position - threat.position;
    double n = away.norm();
    if (n == 0.0 || !std::isfinite(n)) {
        return ControlDecision::Zero();
    }

    Vec2 accel = away * (snapshot.aircraft.max_accel / n);
    return effectiveAcceleration(snapshot.aircraft, accel, snapshot.time_step);
}

void EvasionController::reset() {
    warm_start_.reset();
    last_report_ = TickReport();
    tick_count_ = 0;
    degraded_count_ = 0;
}

int EvasionController::countImminentThreats(const Snapshot& snapshot) const {
    double horizon_time = snapshot.horizon * snapshot.time_step;
    int count = 0;
    for (const auto& assessment : assessThreats(snapshot, config_.danger_radius)) {
        if (assessment.time_to_reach && *assessment.time_to_reach <= horizon_time) {
            ++count;
        }
    }
    return count;
}

// Factory functions
std::shared_ptr<EvasionController> createEvasionController(const ControllerConfig& config) {
    return std::make_shared<EvasionController>(config);
}

std::shared_ptr<TargetSeekingController> createTargetSeekingController(const ControllerConfig& config) {
    return std::make_shared<TargetSeekingController>(config);
}

} // namespace evasion_control
