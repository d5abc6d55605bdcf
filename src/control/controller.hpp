#pragma once

#include "types.hpp"
#include "objectives.hpp"
#include "optimizer.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <spdlog/fwd.h>
#include <string>
#include <vector>

namespace evasion_control {

/**
 * @brief Controller configuration
 *
 * Immutable once handed to an EvasionController. Aircraft limits seed the
 * aircraft of the simulation harness and cap the limits carried by each
 * LiveState.
 */
struct ControllerConfig {
    ObjectiveKind objective;        // Scoring strategy
    int horizon;                    // Planned ticks
    double time_step;               // Tick length [s]
    double max_accel;               // Aircraft acceleration limit [m/s^2]
    double max_speed;               // Aircraft speed limit [m/s]
    double survival_radius;         // Minimum threat separation, 0 disables [m]
    double target_weight;           // Weight of the final distance to the target
    double solver_tolerance;        // Stationarity and tie-break tolerance
    int max_restarts;               // Perturbed starts after the primary one
    double time_budget;             // Wall clock budget per tick [s]
    double constraint_tolerance;    // Allowed survival radius shortfall [m]
    int max_iterations;             // Descent steps per start and multiplier update
    double danger_radius;           // Radius of the threat time-to-reach estimate [m]

    ControllerConfig()
        : objective(ObjectiveKind::MIN_DISTANCE), horizon(5), time_step(0.05),
          max_accel(15.0), max_speed(20.0), survival_radius(0.0), target_weight(0.2),
          solver_tolerance(1e-6), max_restarts(4), time_budget(0.5),
          constraint_tolerance(1e-3), max_iterations(100), danger_radius(5.0) {}

    /**
     * @brief Check every field
     * @throws InvalidArgument naming the first offending field
     */
    void validate() const;

    /**
     * @brief Solver settings derived from this configuration
     */
    SolverSettings solverSettings() const;
};

/**
 * @brief View of the simulation state the controller reads each tick
 */
struct LiveState {
    AircraftState aircraft;
    TargetState target;
    std::vector<ThreatState> threats;
};

/**
 * @brief Diagnostics of the last controller tick
 */
struct TickReport {
    ControlDecision control;
    bool degraded;              // Fallback used instead of an optimized plan
    std::string reason;         // Failure message of a degraded tick
    double score;               // Objective value, NaN on degraded ticks
    int imminent_threats;       // Active threats that reach the danger radius within the horizon

    TickReport()
        : control(ControlDecision::Zero()), degraded(false), score(0.0), imminent_threats(0) {}
};

/**
 * @brief Base class for anything that flies the aircraft tick by tick
 */
class AircraftController {
public:
    /**
     * @brief Destructor
     */
    virtual ~AircraftController() = default;

    /**
     * @brief Compute the acceleration for the upcoming tick
     * @param live Current simulation state, never modified
     * @return Acceleration with |a| <= max_accel
     * @throws InvalidArgument for a malformed state
     */
    virtual ControlDecision nextAcceleration(const LiveState& live) = 0;

    /**
     * @brief Configuration supplying dt and the aircraft limits
     */
    virtual const ControllerConfig& getConfig() const = 0;

    /**
     * @brief Ticks flown without an optimized plan
     */
    virtual long degradedTickCount() const { return 0; }
};

/**
 * @brief Baseline pilot that heads for the target and ignores threats
 *
 * Steers the velocity toward target - x, so the distance to a fixed target
 * decays exponentially and the aircraft lands softly. Velocity changes are
 * limited to max_accel * dt per tick and the speed to max_speed.
 */
class TargetSeekingController : public AircraftController {
public:
    /**
     * @brief Constructor
     * @param config Only time_step and the aircraft limits are used
     * @throws InvalidArgument for an invalid configuration
     */
    explicit TargetSeekingController(const ControllerConfig& config);

    ControlDecision nextAcceleration(const LiveState& live) override;

    const ControllerConfig& getConfig() const override { return config_; }

private:
    ControllerConfig config_;
};

/**
 * @brief Receding-horizon evasion controller
 *
 * Each call captures a Snapshot, solves the horizon problem and returns the
 * first acceleration of the plan. Solver failures are absorbed with a
 * fallback acceleration and reported as degraded ticks; malformed input
 * raises InvalidArgument.
 */
class EvasionController : public AircraftController {
public:
    /**
     * @brief Constructor
     * @param config Controller configuration
     * @throws InvalidArgument for an invalid configuration
     */
    explicit EvasionController(const ControllerConfig& config);

    /**
     * @brief Solve the horizon problem and return its first acceleration
     *
     * Falls back to fallbackAcceleration() when no feasible plan is found.
     */
    ControlDecision nextAcceleration(const LiveState& live) override;

    /**
     * @brief Capture a snapshot of the live state with the configured dt and horizon
     *
     * The aircraft limits are the tighter of the live and the configured ones.
     */
    Snapshot captureSnapshot(const LiveState& live) const;

    /**
     * @brief Acceleration used when no feasible plan was found
     *
     * Full acceleration directly away from the most dangerous active threat,
     * reduced to what the speed limit lets through. Zero without an active
     * threat or when the aircraft sits on the threat.
     */
    ControlDecision fallbackAcceleration(const Snapshot& snapshot) const;

    /**
     * @brief Forget the warm start and the diagnostics
     */
    void reset();

    const ControllerConfig& getConfig() const override { return config_; }
    const TickReport& lastReport() const { return last_report_; }
    long tickCount() const { return tick_count_; }
    long degradedTickCount() const override { return degraded_count_; }
    bool hasWarmStart() const { return warm_start_.has_value(); }

private:
    ControllerConfig config_;
    std::shared_ptr<Objective> objective_;
    std::shared_ptr<TrajectoryOptimizer> optimizer_;
    std::shared_ptr<spdlog::logger> logger_;

    std::optional<Eigen::VectorXd> warm_start_;
    TickReport last_report_;
    long tick_count_;
    long degraded_count_;

    int countImminentThreats(const Snapshot& snapshot) const;
};

/**
 * @brief Create evasion controller
 * @param config Controller configuration
 * @return Shared pointer to controller
 */
std::shared_ptr<EvasionController> createEvasionController(const ControllerConfig& config);

/**
 * @brief Create the threat-ignoring baseline pilot
 * @param config Controller configuration
 * @return Shared pointer to controller
 */
std::shared_ptr<TargetSeekingController> createTargetSeekingController(const ControllerConfig& config);

} // namespace evasion_control
