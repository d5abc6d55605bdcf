#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace evasion_control {

using Vec2 = Eigen::Vector2d;

/**
 * @brief Objective selector for the trajectory optimizer
 */
enum class ObjectiveKind {
    FUEL = 0,                       // Minimize control effort
    MIN_DISTANCE,                   // Maximize worst separation over the horizon
    NEXT_DISTANCE                   // Maximize separation at the next tick
};

/**
 * @brief Position and velocity of a point body
 */
struct MovingObjectState {
    Vec2 position;      // Position [m]
    Vec2 velocity;      // Velocity [m/s]

    MovingObjectState() : position(Vec2::Zero()), velocity(Vec2::Zero()) {}

    MovingObjectState(const Vec2& x, const Vec2& v) : position(x), velocity(v) {}
};

/**
 * @brief Controlled aircraft state
 *
 * Speed is bounded by max_speed; the commanded acceleration by max_accel.
 */
struct AircraftState : MovingObjectState {
    double max_speed;   // [m/s]
    double max_accel;   // [m/s^2]

    AircraftState() : max_speed(20.0), max_accel(15.0) {}

    AircraftState(const Vec2& x, const Vec2& v, double vmax, double amax)
        : MovingObjectState(x, v), max_speed(vmax), max_accel(amax) {}
};

/**
 * @brief Unguided projectile state
 *
 * The projectile keeps the heading of its velocity and travels at a constant
 * speed. Inactive threats are ignored by every consumer.
 */
struct ThreatState : MovingObjectState {
    double speed;       // Constant speed magnitude [m/s]
    bool active;

    ThreatState() : speed(0.0), active(true) {}

    ThreatState(const Vec2& x, const Vec2& v, double s, bool is_active = true)
        : MovingObjectState(x, v), speed(s), active(is_active) {}
};

/**
 * @brief Target the aircraft flies to
 */
struct TargetState : MovingObjectState {
    TargetState() = default;

    explicit TargetState(const Vec2& x) : MovingObjectState(x, Vec2::Zero()) {}

    TargetState(const Vec2& x, const Vec2& v) : MovingObjectState(x, v) {}
};

/**
 * @brief Acceleration command for the upcoming tick [m/s^2]
 */
using ControlDecision = Vec2;

/**
 * @brief Input of one optimization call
 *
 * Built by value each tick; never mutated by the optimizer.
 */
struct Snapshot {
    AircraftState aircraft;
    TargetState target;
    std::vector<ThreatState> threats;
    double time_step;
    int horizon;

    Snapshot() : time_step(0.05), horizon(5) {}
};

/**
 * @brief Outcome of a trajectory optimization
 */
struct OptimizationResult {
    Eigen::VectorXd plan;           // Flattened accelerations, 2 per tick
    ControlDecision control;        // Effective first-tick acceleration
    double score;                   // Objective value of the plan
    double max_violation;           // Worst survival constraint violation [m]
    int iterations;                 // Accepted descent steps, all starts
    int starts;                     // Number of starting points tried
    bool converged;                 // Winning start met the stationarity test

    OptimizationResult()
        : control(ControlDecision::Zero()), score(0.0), max_violation(0.0),
          iterations(0), starts(0), converged(false) {}
};

/**
 * @brief Utility functions for state manipulation
 */
namespace utils {

    /**
     * @brief Number of scalar decision variables per tick
     */
    inline constexpr int controlDim() { return 2; }

    /**
     * @brief Check that both components are finite
     */
    inline bool isFinite(const Vec2& v) {
        return std::isfinite(v.x()) && std::isfinite(v.y());
    }

    /**
     * @brief Heading of a velocity, zero vector for a body at rest
     */
    inline Vec2 heading(const Vec2& velocity) {
        double n = velocity.norm();
        if (n == 0.0) {
            return Vec2::Zero();
        }
        return velocity / n;
    }

    /**
     * @brief Scale a vector down so that its norm does not exceed max_norm
     *
     * Preserves direction. Vectors already inside the ball are returned
     * unchanged.
     */
    inline Vec2 clampNorm(const Vec2& v, double max_norm) {
        double n = v.norm();
        if (n > max_norm && n > 0.0) {
            return v * (max_norm / n);
        }
        return v;
    }

    /**
     * @brief Count threats that are still active
     */
    inline int activeThreatCount(const std::vector<ThreatState>& threats) {
        int count = 0;
        for (const auto& threat : threats) {
            if (threat.active) {
                ++count;
            }
        }
        return count;
    }

    /**
     * @brief Parse an objective name (fuel, min_distance, next_distance)
     * @throws InvalidArgument for an unknown name
     */
    ObjectiveKind parseObjectiveKind(const std::string& name);

    /**
     * @brief Configuration name of an objective
     */
    std::string objectiveName(ObjectiveKind kind);
}

} // namespace evasion_control
