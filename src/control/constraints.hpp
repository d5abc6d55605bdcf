#pragma once

#include "types.hpp"
#include "integrator.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace evasion_control {

/**
 * @brief Constraint violation type
 */
enum class ConstraintType {
    ACCEL_LIMIT,        // |a| > max_accel
    SPEED_LIMIT         // |v| > max_speed
};

/**
 * @brief Constraint violation information
 */
struct ConstraintViolation {
    ConstraintType type;
    double value;
    double limit;
    double violation_magnitude;
    bool is_violated;

    ConstraintViolation(ConstraintType t, double v, double l, double vm, bool iv)
        : type(t), value(v), limit(l), violation_magnitude(vm), is_violated(iv) {}
};

/**
 * @brief Checks controls against the aircraft limits and rollouts against
 * the survival radius
 *
 * Separation is checked on ticks 1..last_tick of the rollout against every
 * active threat.
 */
class ConstraintChecker {
public:
    /**
     * @brief Constructor
     * @param survival_radius Minimum allowed separation [m], 0 disables
     * @param tolerance Violation still counted as feasible [m]
     */
    ConstraintChecker(double survival_radius, double tolerance);

    /**
     * @brief Check a single acceleration against max_accel
     */
    ConstraintViolation checkAcceleration(const AircraftState& aircraft, const Vec2& accel) const;

    /**
     * @brief Check a velocity against max_speed
     */
    ConstraintViolation checkSpeed(const AircraftState& aircraft, const Vec2& velocity) const;

    /**
     * @brief Survival constraint residuals g = R - d, feasible when g <= 0
     * @param trajectory Aircraft rollout
     * @param threat_paths Output of predictThreatPaths
     * @param last_tick Last tick checked
     * @return One residual per (tick, active threat), tick-major
     */
    std::vector<double> separationResiduals(const Trajectory& trajectory,
                                            const std::vector<std::vector<Vec2>>& threat_paths,
                                            int last_tick) const;

    /**
     * @brief Whether the survival constraint is active at all
     */
    bool hasSurvivalConstraint() const { return survival_radius_ > 0.0; }

    double getSurvivalRadius() const { return survival_radius_; }
    double getTolerance() const { return tolerance_; }

private:
    double survival_radius_;
    double tolerance_;
};

/**
 * @brief Validate a snapshot before it enters the optimizer
 * @throws InvalidArgument for non-finite values, non-positive time step,
 *         horizon or limits, negative threat speed, or an aircraft already
 *         faster than max_speed
 */
void validateSnapshot(const Snapshot& snapshot);

/**
 * @brief Project every per-tick acceleration onto the max_accel ball
 * @param plan Flattened plan, modified in place
 * @param max_accel Acceleration bound [m/s^2]
 */
void projectOntoLimits(Eigen::VectorXd& plan, double max_accel);

/**
 * @brief Create constraint checker
 * @param survival_radius Minimum allowed separation [m]
 * @param tolerance Feasibility tolerance [m]
 * @return Shared pointer to constraint checker
 */
std::shared_ptr<ConstraintChecker> createConstraintChecker(double survival_radius, double tolerance);

} // namespace evasion_control
