#include "constraints.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace evasion_control {

namespace {

// Relative slack on the speed invariant for values coming out of an integrator
constexpr double kSpeedSlack = 1e-9;

void requireFinite(const Vec2& v, const std::string& what) {
    if (!utils::isFinite(v)) {
        throw InvalidArgument(what + " must be finite");
    }
}

} // namespace

// ConstraintChecker implementation
ConstraintChecker::ConstraintChecker(double survival_radius, double tolerance)
    : survival_radius_(survival_radius), tolerance_(tolerance) {
    if (!(survival_radius >= 0.0) || !std::isfinite(survival_radius)) {
        throw InvalidArgument("Survival radius must be a non-negative number");
    }
    if (!(tolerance >= 0.0) || !std::isfinite(tolerance)) {
        throw InvalidArgument("Constraint tolerance must be a non-negative number");
    }
}

ConstraintViolation ConstraintChecker::checkAcceleration(const AircraftState& aircraft, const Vec2& accel) const {
    double a = accel.norm();
    double violation_magnitude = std::max(0.0, a - aircraft.max_accel);
    bool is_violated = violation_magnitude > tolerance_;

    return ConstraintViolation(ConstraintType::ACCEL_LIMIT, a, aircraft.max_accel, violation_magnitude, is_violated);
}

ConstraintViolation ConstraintChecker::checkSpeed(const AircraftState& aircraft, const Vec2& velocity) const {
    double speed = velocity.norm();
    double violation_magnitude = std::max(0.0, speed - aircraft.max_speed);
    bool is_violated = violation_magnitude > tolerance_;

    return ConstraintViolation(ConstraintType::SPEED_LIMIT, speed, aircraft.max_speed, violation_magnitude, is_violated);
}

std::vector<double> ConstraintChecker::separationResiduals(const Trajectory& trajectory,
                                                           const std::vector<std::vector<Vec2>>& threat_paths,
                                                           int last_tick) const {
    std::vector<double> residuals;
    if (!hasSurvivalConstraint()) {
        return residuals;
    }
    int n = std::min({last_tick, trajectory.ticks(), static_cast<int>(threat_paths.size()) - 1});
    for (int k = 1; k <= n; ++k) {
        for (const auto& threat_position : threat_paths[k]) {
            residuals.push_back(survival_radius_ - (trajectory.positions[k] - threat_position).norm());
        }
    }
    return residuals;
}

void validateSnapshot(const Snapshot& snapshot) {
    if (!(snapshot.time_step > 0.0) || !std::isfinite(snapshot.time_step)) {
        throw InvalidArgument("Time step must be positive and finite");
    }
    if (snapshot.horizon < 1) {
        throw InvalidArgument("Horizon must be at least one tick");
    }

    const AircraftState& aircraft = snapshot.aircraft;
    requireFinite(aircraft.position, "Aircraft position");
    requireFinite(aircraft.velocity, "Aircraft velocity");
    if (!(aircraft.max_speed > 0.0) || !std::isfinite(aircraft.max_speed)) {
        throw InvalidArgument("Aircraft max_speed must be positive and finite");
    }
    if (!(aircraft.max_accel > 0.0) || !std::isfinite(aircraft.max_accel)) {
        throw InvalidArgument("Aircraft max_accel must be positive and finite");
    }
    if (aircraft.velocity.norm() > aircraft.max_speed * (1.0 + kSpeedSlack)) {
        throw InvalidArgument("Aircraft speed " + std::to_string(aircraft.velocity.norm()) +
                              " exceeds max_speed " + std::to_string(aircraft.max_speed));
    }

    requireFinite(snapshot.target.position, "Target position");
    requireFinite(snapshot.target.velocity, "Target velocity");

    for (const auto& threat : snapshot.threats) {
        if (!threat.active) {
            continue;
        }
        requireFinite(threat.position, "Threat position");
        requireFinite(threat.velocity, "Threat velocity");
        if (!(threat.speed >= 0.0) || !std::isfinite(threat.speed)) {
            throw InvalidArgument("Threat speed must be non-negative and finite");
        }
    }
}

void projectOntoLimits(Eigen::VectorXd& plan, double max_accel) {
    int n = static_cast<int>(plan.size()) / utils::controlDim();
    for (int k = 0; k < n; ++k) {
        auto block = plan.segment<2>(utils::controlDim() * k);
        double a = block.norm();
        if (a > max_accel) {
            block *= max_accel / a;
        }
    }
}

// Factory functions
std::shared_ptr<ConstraintChecker> createConstraintChecker(double survival_radius, double tolerance) {
    return std::make_shared<ConstraintChecker>(survival_radius, tolerance);
}

} // namespace evasion_control
