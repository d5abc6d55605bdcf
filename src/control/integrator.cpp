#include "integrator.hpp"
#include "threat_model.hpp"
#include <algorithm>

namespace evasion_control {

AircraftState integrateStep(const AircraftState& aircraft, const Vec2& accel, double dt) {
    AircraftState next = aircraft;
    next.velocity = utils::clampNorm(aircraft.velocity + accel * dt, aircraft.max_speed);
    next.position = aircraft.position + next.velocity * dt;
    return next;
}

Vec2 effectiveAcceleration(const AircraftState& aircraft, const Vec2& accel, double dt) {
    Vec2 v_next = utils::clampNorm(aircraft.velocity + accel * dt, aircraft.max_speed);
    return (v_next - aircraft.velocity) / dt;
}

Trajectory rollout(const Snapshot& snapshot, const Eigen::VectorXd& plan) {
    return rollout(snapshot, plan, snapshot.horizon);
}

Trajectory rollout(const Snapshot& snapshot, const Eigen::VectorXd& plan, int ticks) {
    Trajectory trajectory;
    int n = std::min(ticks, static_cast<int>(plan.size()) / utils::controlDim());
    trajectory.positions.reserve(n + 1);
    trajectory.velocities.reserve(n + 1);

    AircraftState current = snapshot.aircraft;
    trajectory.positions.push_back(current.position);
    trajectory.velocities.push_back(current.velocity);

    for (int k = 0; k < n; ++k) {
        current = integrateStep(current, planControl(plan, k), snapshot.time_step);
        trajectory.positions.push_back(current.position);
        trajectory.velocities.push_back(current.velocity);
    }
    return trajectory;
}

std::vector<std::vector<Vec2>> predictThreatPaths(const Snapshot& snapshot, int ticks) {
    std::vector<std::vector<Vec2>> paths(ticks + 1);
    for (int k = 0; k <= ticks; ++k) {
        double dt = k * snapshot.time_step;
        for (const auto& threat : snapshot.threats) {
            if (threat.active) {
                paths[k].push_back(predict(threat, dt));
            }
        }
    }
    return paths;
}

} // namespace evasion_control
