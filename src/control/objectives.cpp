#include "objectives.hpp"
#include "errors.hpp"
#include "smooth_functions.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace evasion_control {

// Objective implementation
Objective::Objective(ObjectiveKind kind, double target_weight)
    : kind_(kind), target_weight_(target_weight) {
    if (!(target_weight >= 0.0) || !std::isfinite(target_weight)) {
        throw InvalidArgument("Target weight must be a non-negative number");
    }
}

double Objective::targetTerm(const Snapshot& snapshot, const Trajectory& trajectory) const {
    double t_end = trajectory.ticks() * snapshot.time_step;
    Vec2 target = snapshot.target.position + snapshot.target.velocity * t_end;
    return target_weight_ * smooth::smooth_norm(trajectory.positions.back() - target);
}

// FuelObjective implementation
FuelObjective::FuelObjective(double target_weight)
    : Objective(ObjectiveKind::FUEL, target_weight) {
}

double FuelObjective::score(const Snapshot& snapshot, const Eigen::VectorXd& controls) const {
    Trajectory trajectory = rollout(snapshot, controls);
    return controls.squaredNorm() + targetTerm(snapshot, trajectory);
}

// MinDistanceObjective implementation
MinDistanceObjective::MinDistanceObjective(double target_weight)
    : Objective(ObjectiveKind::MIN_DISTANCE, target_weight) {
}

double MinDistanceObjective::score(const Snapshot& snapshot, const Eigen::VectorXd& controls) const {
    Trajectory trajectory = rollout(snapshot, controls);
    auto threat_paths = predictThreatPaths(snapshot, trajectory.ticks());

    double separation = minimumSeparation(trajectory, threat_paths, 1, trajectory.ticks());
    double threat_term = std::isfinite(separation) ? -separation : 0.0;
    return threat_term + targetTerm(snapshot, trajectory);
}

// NextDistanceObjective implementation
NextDistanceObjective::NextDistanceObjective(double target_weight)
    : Objective(ObjectiveKind::NEXT_DISTANCE, target_weight) {
}

double NextDistanceObjective::score(const Snapshot& snapshot, const Eigen::VectorXd& controls) const {
    Trajectory trajectory = rollout(snapshot, controls);
    auto threat_paths = predictThreatPaths(snapshot, std::min(1, trajectory.ticks()));

    double separation = minimumSeparation(trajectory, threat_paths, 1, 1);
    double threat_term = std::isfinite(separation) ? -separation : 0.0;
    return threat_term + targetTerm(snapshot, trajectory);
}

double minimumSeparation(const Trajectory& trajectory,
                         const std::vector<std::vector<Vec2>>& threat_paths,
                         int first_tick, int last_tick) {
    double min_distance = std::numeric_limits<double>::infinity();
    int n = std::min(last_tick, std::min(trajectory.ticks(), static_cast<int>(threat_paths.size()) - 1));
    for (int k = std::max(0, first_tick); k <= n; ++k) {
        for (const auto& threat_position : threat_paths[k]) {
            min_distance = std::min(min_distance, (trajectory.positions[k] - threat_position).norm());
        }
    }
    return min_distance;
}

int observedTicks(ObjectiveKind kind, int horizon) {
    if (kind == ObjectiveKind::NEXT_DISTANCE) {
        return std::min(1, horizon);
    }
    return horizon;
}

// Factory functions
std::shared_ptr<Objective> createObjective(ObjectiveKind kind, double target_weight) {
    switch (kind) {
        case ObjectiveKind::FUEL:
            return std::make_shared<FuelObjective>(target_weight);
        case ObjectiveKind::MIN_DISTANCE:
            return std::make_shared<MinDistanceObjective>(target_weight);
        case ObjectiveKind::NEXT_DISTANCE:
            return std::make_shared<NextDistanceObjective>(target_weight);
        default:
            throw InvalidArgument("Unknown objective kind");
    }
}

} // namespace evasion_control
