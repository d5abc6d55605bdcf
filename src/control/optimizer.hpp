#pragma once

#include "types.hpp"
#include "constraints.hpp"
#include "objectives.hpp"
#include <Eigen/Dense>
#include <chrono>
#include <memory>
#include <optional>
#include <spdlog/fwd.h>
#include <vector>

namespace evasion_control {

/**
 * @brief Numerical settings of the trajectory optimizer
 */
struct SolverSettings {
    double survival_radius;         // Minimum separation, 0 disables [m]
    double tolerance;               // Stationarity and score tie tolerance
    double constraint_tolerance;    // Allowed survival radius shortfall [m]
    int max_restarts;               // Perturbed starts after the primary one
    int max_iterations;             // Descent steps per start and multiplier update
    int max_outer_iterations;       // Multiplier updates per start
    double time_budget;             // Wall clock budget per solve [s]
    double restart_scale;           // Perturbed start magnitude, fraction of max_accel

    SolverSettings()
        : survival_radius(0.0), tolerance(1e-6), constraint_tolerance(1e-3),
          max_restarts(4), max_iterations(100), max_outer_iterations(6),
          time_budget(0.5), restart_scale(0.9) {}
};

/**
 * @brief Receding-horizon trajectory optimizer
 *
 * Minimizes an Objective over horizon accelerations with projected gradient
 * descent on an augmented Lagrangian of the survival constraints:
 * - |a_k| <= max_accel is kept by projection onto each 2-D ball
 * - |v_k| <= max_speed is kept by clamping inside the rollout
 * - separation >= survival_radius over the ticks the objective observes is
 *   handled by multipliers and checked on every accepted iterate
 *
 * The primary start (warm start or zeros) is followed by max_restarts
 * perturbed starts. The best feasible iterate over all starts wins; scores
 * within tolerance are broken by the smaller first control.
 */
class TrajectoryOptimizer {
public:
    /**
     * @brief Constructor
     * @param settings Solver settings
     * @throws InvalidArgument for invalid settings
     */
    explicit TrajectoryOptimizer(const SolverSettings& settings);

    /**
     * @brief Solve one receding-horizon problem
     * @param snapshot Validated snapshot
     * @param objective Objective to minimize
     * @param warm_start Optional initial plan of 2*horizon scalars
     * @return Best feasible plan and its effective first control
     * @throws OptimizationFailed if no start produced a feasible plan in time
     */
    OptimizationResult solve(const Snapshot& snapshot, const Objective& objective,
                             const std::optional<Eigen::VectorXd>& warm_start = std::nullopt) const;

    /**
     * @brief Starting points of a solve
     * @param snapshot Snapshot of the solve
     * @param primary Primary plan (warm start or zeros)
     * @return Primary start followed by max_restarts perturbed starts, projected
     */
    std::vector<Eigen::VectorXd> startingPoints(const Snapshot& snapshot,
                                                const Eigen::VectorXd& primary) const;

    /**
     * @brief Get solver settings
     */
    const SolverSettings& getSettings() const { return settings_; }

private:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Best feasible iterate of one start
     */
    struct Candidate {
        Eigen::VectorXd plan;
        double score;
        double violation;
        int iterations;
        bool feasible;
        bool converged;
        bool timed_out;
    };

    /**
     * @brief Augmented Lagrangian problem of one solve
     */
    struct Problem {
        const Snapshot& snapshot;
        const Objective& objective;
        std::vector<std::vector<Vec2>> threat_paths;
        int observed_ticks;
    };

    SolverSettings settings_;
    std::shared_ptr<ConstraintChecker> checker_;
    std::shared_ptr<spdlog::logger> logger_;

    Candidate solveFrom(const Problem& problem, const Eigen::VectorXd& start,
                        Clock::time_point deadline) const;

    double merit(const Problem& problem, const Eigen::VectorXd& z,
                 const std::vector<double>& lambda, double mu) const;

    Eigen::VectorXd meritGradient(const Problem& problem, const Eigen::VectorXd& z,
                                  const std::vector<double>& lambda, double mu) const;

    std::vector<double> residuals(const Problem& problem, const Eigen::VectorXd& z) const;

    bool isBetter(const Candidate& lhs, const Candidate& rhs) const;

    void consider(Candidate& best, const Problem& problem, const Eigen::VectorXd& z) const;
};

/**
 * @brief Create trajectory optimizer
 * @param settings Solver settings
 * @return Shared pointer to optimizer
 */
std::shared_ptr<TrajectoryOptimizer> createTrajectoryOptimizer(const SolverSettings& settings);

} // namespace evasion_control
