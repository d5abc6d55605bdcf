#pragma once

#include "types.hpp"
#include <Eigen/Dense>
#include <vector>

namespace evasion_control {

/**
 * @brief Aircraft path produced by a control plan
 *
 * Index 0 holds the current state, index k the state after k ticks.
 */
struct Trajectory {
    std::vector<Vec2> positions;
    std::vector<Vec2> velocities;

    int ticks() const { return static_cast<int>(positions.size()) - 1; }
};

/**
 * @brief Advance the aircraft by one tick (semi-implicit Euler)
 *
 * v <- clamp(v + a dt, max_speed), x <- x + v dt. The same step is used by
 * every objective, by the constraint checker and for the returned control.
 *
 * @param aircraft Aircraft state before the step
 * @param accel Commanded acceleration
 * @param dt Time step [s]
 * @return State after the step, limits carried over
 */
AircraftState integrateStep(const AircraftState& aircraft, const Vec2& accel, double dt);

/**
 * @brief Acceleration actually realized after speed clamping
 * @param aircraft Aircraft state
 * @param accel Commanded acceleration
 * @param dt Time step [s]
 * @return (clamp(v + a dt) - v) / dt, never longer than accel
 */
Vec2 effectiveAcceleration(const AircraftState& aircraft, const Vec2& accel, double dt);

/**
 * @brief Roll a flattened control plan forward
 * @param snapshot Snapshot providing the initial state, dt and horizon
 * @param plan 2*horizon accelerations
 * @return Aircraft trajectory over the horizon
 */
Trajectory rollout(const Snapshot& snapshot, const Eigen::VectorXd& plan);

/**
 * @brief Roll forward only the first ticks of a plan
 */
Trajectory rollout(const Snapshot& snapshot, const Eigen::VectorXd& plan, int ticks);

/**
 * @brief Predicted threat positions per tick
 *
 * Result[k][j] is the position of the j-th active threat after k ticks,
 * k = 0..ticks.
 */
std::vector<std::vector<Vec2>> predictThreatPaths(const Snapshot& snapshot, int ticks);

/**
 * @brief Access the acceleration of tick k in a flattened plan
 */
inline Vec2 planControl(const Eigen::VectorXd& plan, int k) {
    return plan.segment<2>(utils::controlDim() * k);
}

} // namespace evasion_control
