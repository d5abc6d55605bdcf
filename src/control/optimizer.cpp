#include "optimizer.hpp"
#include "errors.hpp"
#include "integrator.hpp"
#include "smooth_functions.hpp"
#include "../utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace evasion_control {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Augmented Lagrangian penalty schedule
constexpr double kInitialPenalty = 10.0;
constexpr double kMaxPenalty = 1e6;
constexpr double kPenaltyGrowth = 10.0;
constexpr double kRequiredViolationDecrease = 0.25;

// Projected Armijo line search
constexpr double kArmijo = 1e-4;
constexpr double kInitialStep = 1.0;
constexpr double kMaxStep = 100.0;
constexpr double kMinStep = 1e-12;

// Central difference step, relative to the variable magnitude
constexpr double kFdStep = 1e-6;

} // namespace

TrajectoryOptimizer::TrajectoryOptimizer(const SolverSettings& settings)
    : settings_(settings),
      checker_(createConstraintChecker(settings.survival_radius, settings.constraint_tolerance)),
      logger_(logging::getLogger("evasion.optimizer")) {
    if (!(settings.tolerance > 0.0) || !std::isfinite(settings.tolerance)) {
        throw InvalidArgument("Solver tolerance must be positive");
    }
    if (settings.max_restarts < 0) {
        throw InvalidArgument("max_restarts must be non-negative");
    }
    if (settings.max_iterations < 1 || settings.max_outer_iterations < 1) {
        throw InvalidArgument("Iteration limits must be positive");
    }
    if (!(settings.time_budget > 0.0)) {
        throw InvalidArgument("Time budget must be positive");
    }
    if (!(settings.restart_scale > 0.0) || settings.restart_scale > 1.0) {
        throw InvalidArgument("Restart scale must be in (0, 1]");
    }
}

OptimizationResult TrajectoryOptimizer::solve(const Snapshot& snapshot, const Objective& objective,
                                              const std::optional<Eigen::VectorXd>& warm_start) const {
    validateSnapshot(snapshot);

    auto budget = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(settings_.time_budget));
    Clock::time_point deadline = Clock::now() + budget;

    int observed = observedTicks(objective.kind(), snapshot.horizon);
    Problem problem{snapshot, objective, predictThreatPaths(snapshot, observed), observed};

    int n = utils::controlDim() * snapshot.horizon;
    Eigen::VectorXd primary = Eigen::VectorXd::Zero(n);
    if (warm_start && warm_start->size() == n && warm_start->allFinite()) {
        primary = *warm_start;
    }

    Candidate best;
    best.feasible = false;
    best.converged = false;
    best.timed_out = false;
    best.iterations = 0;
    best.score = std::numeric_limits<double>::infinity();
    best.violation = std::numeric_limits<double>::infinity();

    OptimizationResult result;
    auto starts = startingPoints(snapshot, primary);
    for (size_t i = 0; i < starts.size(); ++i) {
        if (i > 0 && Clock::now() >= deadline) {
            logger_->debug("Time budget exhausted after {} starts", i);
            break;
        }

        Candidate candidate = solveFrom(problem, starts[i], deadline);
        result.iterations += candidate.iterations;
        result.starts += 1;
        logger_->debug("Start {}: feasible={} score={:.6f} violation={:.6f} iterations={} converged={}",
                       i, candidate.feasible, candidate.score, candidate.violation,
                       candidate.iterations, candidate.converged);

        if (candidate.feasible && isBetter(candidate, best)) {
            best = candidate;
        }
        if (candidate.timed_out) {
            logger_->debug("Time budget exhausted during start {}", i);
            break;
        }
    }

    if (!best.feasible) {
        throw OptimizationFailed("No feasible plan after " + std::to_string(result.starts) +
                                 " start(s) and " + std::to_string(result.iterations) + " iteration(s)");
    }

    const AircraftState& aircraft = snapshot.aircraft;
    result.plan = best.plan;
    result.control = effectiveAcceleration(aircraft, planControl(best.plan, 0), snapshot.time_step);

    // The applied control must respect both aircraft limits
    ConstraintViolation accel = checker_->checkAcceleration(aircraft, result.control);
    ConstraintViolation speed = checker_->checkSpeed(aircraft, aircraft.velocity + result.control * snapshot.time_step);
    if (accel.is_violated || speed.is_violated) {
        throw OptimizationFailed("First control breaks the aircraft limits: |a|=" + std::to_string(accel.value) +
                                 " |v|=" + std::to_string(speed.value));
    }

    result.score = best.score;
    result.max_violation = best.violation;
    result.converged = best.converged;
    return result;
}

std::vector<Eigen::VectorXd> TrajectoryOptimizer::startingPoints(const Snapshot& snapshot,
                                                                 const Eigen::VectorXd& primary) const {
    std::vector<Eigen::VectorXd> starts;
    double max_accel = snapshot.aircraft.max_accel;

    Eigen::VectorXd first = primary;
    projectOntoLimits(first, max_accel);
    starts.push_back(first);

    // Spread the perturbations around the bearing to the target
    Vec2 axis = snapshot.target.position - snapshot.aircraft.position;
    double bearing = axis.norm() > 0.0 ? std::atan2(axis.y(), axis.x()) : 0.0;
    int ticks = static_cast<int>(primary.size()) / utils::controlDim();

    for (int r = 0; r < settings_.max_restarts; ++r) {
        double theta = bearing + 0.25 * kPi + 2.0 * kPi * r / settings_.max_restarts;
        Vec2 offset = Vec2(std::cos(theta), std::sin(theta)) * (settings_.restart_scale * max_accel);

        Eigen::VectorXd start = primary;
        for (int k = 0; k < ticks; ++k) {
            start.segment<2>(utils::controlDim() * k) += offset;
        }
        projectOntoLimits(start, max_accel);
        starts.push_back(start);
    }
    return starts;
}

TrajectoryOptimizer::Candidate TrajectoryOptimizer::solveFrom(const Problem& problem,
                                                              const Eigen::VectorXd& start,
                                                              Clock::time_point deadline) const {
    const double max_accel = problem.snapshot.aircraft.max_accel;

    Candidate best;
    best.feasible = false;
    best.converged = false;
    best.timed_out = false;
    best.iterations = 0;
    best.score = std::numeric_limits<double>::infinity();
    best.violation = std::numeric_limits<double>::infinity();

    Eigen::VectorXd z = start;
    projectOntoLimits(z, max_accel);
    consider(best, problem, z);

    std::vector<double> lambda(residuals(problem, z).size(), 0.0);
    double mu = kInitialPenalty;
    double alpha = kInitialStep;
    double previous_violation = std::numeric_limits<double>::infinity();
    int iterations = 0;

    for (int outer = 0; outer < settings_.max_outer_iterations; ++outer) {
        bool stationary = false;

        for (int it = 0; it < settings_.max_iterations; ++it) {
            if (Clock::now() >= deadline) {
                best.timed_out = true;
                best.iterations = iterations;
                return best;
            }

            double value = merit(problem, z, lambda, mu);
            Eigen::VectorXd gradient = meritGradient(problem, z, lambda, mu);

            Eigen::VectorXd projected = z - gradient;
            projectOntoLimits(projected, max_accel);
            if ((projected - z).lpNorm<Eigen::Infinity>() <= settings_.tolerance) {
                stationary = true;
                break;
            }

            bool accepted = false;
            double step = alpha;
            Eigen::VectorXd trial;
            while (step >= kMinStep) {
                trial = z - step * gradient;
                projectOntoLimits(trial, max_accel);
                if (merit(problem, trial, lambda, mu) <= value + kArmijo * gradient.dot(trial - z)) {
                    accepted = true;
                    break;
                }
                step *= 0.5;
            }
            if (!accepted) {
                break;
            }

            z = trial;
            ++iterations;
            consider(best, problem, z);
            alpha = std::min(2.0 * step, kMaxStep);
        }

        std::vector<double> g = residuals(problem, z);
        if (g.empty()) {
            best.converged = stationary;
            break;
        }

        double violation = 0.0;
        for (size_t i = 0; i < g.size(); ++i) {
            violation = std::max(violation, g[i]);
            lambda[i] = std::max(0.0, lambda[i] + mu * g[i]);
        }
        if (stationary && violation <= settings_.constraint_tolerance) {
            best.converged = true;
            break;
        }
        if (violation > kRequiredViolationDecrease * previous_violation) {
            mu = std::min(mu * kPenaltyGrowth, kMaxPenalty);
        }
        previous_violation = violation;
    }

    best.iterations = iterations;
    return best;
}

double TrajectoryOptimizer::merit(const Problem& problem, const Eigen::VectorXd& z,
                                  const std::vector<double>& lambda, double mu) const {
    double value = problem.objective.score(problem.snapshot, z);
    if (lambda.empty()) {
        return value;
    }

    std::vector<double> g = residuals(problem, z);
    double penalty = 0.0;
    for (size_t i = 0; i < g.size() && i < lambda.size(); ++i) {
        penalty += smooth::squared_hinge(lambda[i] + mu * g[i]) - lambda[i] * lambda[i];
    }
    return value + penalty / (2.0 * mu);
}

Eigen::VectorXd TrajectoryOptimizer::meritGradient(const Problem& problem, const Eigen::VectorXd& z,
                                                   const std::vector<double>& lambda, double mu) const {
    Eigen::VectorXd gradient(z.size());
    Eigen::VectorXd probe = z;
    for (int i = 0; i < z.size(); ++i) {
        double h = kFdStep * std::max(1.0, std::abs(z(i)));
        probe(i) = z(i) + h;
        double forward = merit(problem, probe, lambda, mu);
        probe(i) = z(i) - h;
        double backward = merit(problem, probe, lambda, mu);
        probe(i) = z(i);
        gradient(i) = (forward - backward) / (2.0 * h);
    }
    return gradient;
}

std::vector<double> TrajectoryOptimizer::residuals(const Problem& problem, const Eigen::VectorXd& z) const {
    if (!checker_->hasSurvivalConstraint()) {
        return {};
    }
    Trajectory trajectory = rollout(problem.snapshot, z, problem.observed_ticks);
    return checker_->separationResiduals(trajectory, problem.threat_paths, problem.observed_ticks);
}

bool TrajectoryOptimizer::isBetter(const Candidate& lhs, const Candidate& rhs) const {
    if (!rhs.feasible) {
        return lhs.feasible;
    }
    if (!lhs.feasible) {
        return false;
    }
    if (lhs.score < rhs.score - settings_.tolerance) {
        return true;
    }
    if (lhs.score > rhs.score + settings_.tolerance) {
        return false;
    }
    return planControl(lhs.plan, 0).norm() < planControl(rhs.plan, 0).norm();
}

void TrajectoryOptimizer::consider(Candidate& best, const Problem& problem, const Eigen::VectorXd& z) const {
    Candidate candidate;
    candidate.plan = z;
    candidate.score = problem.objective.score(problem.snapshot, z);
    candidate.violation = 0.0;
    for (double g : residuals(problem, z)) {
        candidate.violation = std::max(candidate.violation, g);
    }
    candidate.feasible = candidate.violation <= settings_.constraint_tolerance;
    candidate.iterations = 0;
    candidate.converged = false;
    candidate.timed_out = false;

    if (isBetter(candidate, best)) {
        best.plan = candidate.plan;
        best.score = candidate.score;
        best.violation = candidate.violation;
        best.feasible = true;
    }
}

// Factory functions
std::shared_ptr<TrajectoryOptimizer> createTrajectoryOptimizer(const SolverSettings& settings) {
    return std::make_shared<TrajectoryOptimizer>(settings);
}

} // namespace evasion_control
