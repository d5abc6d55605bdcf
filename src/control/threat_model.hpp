#pragma once

#include "types.hpp"
#include <optional>
#include <vector>

namespace evasion_control {

/**
 * @brief Firing solution of a stationary launcher
 */
struct FiringSolution {
    double time;        // Time to intercept [s]
    Vec2 velocity;      // Projectile launch velocity [m/s]
};

/**
 * @brief Danger estimate of one threat relative to the aircraft
 */
struct ThreatAssessment {
    int index;                          // Index in Snapshot::threats
    double distance;                    // Current separation [m]
    std::optional<double> time_to_reach; // Time to come within the danger radius [s]
    double closest_approach;            // Closest approach distance, both bodies unaccelerated [m]
    double closest_approach_time;       // Time of closest approach, negative if in the past [s]

    bool receding() const { return closest_approach_time < 0.0; }
};

/**
 * @brief Predict a threat position after dt
 * @param threat Threat state
 * @param dt Elapsed time [s], must be non-negative
 * @return Position assuming straight flight at constant speed
 * @throws InvalidArgument if dt is negative
 */
Vec2 predict(const ThreatState& threat, double dt);

/**
 * @brief Earliest time the threat comes within radius of a point
 * @param threat Threat state
 * @param point Fixed point
 * @param radius Proximity radius [m]
 * @return Time [s], 0 if already inside, nullopt if it never gets there
 */
std::optional<double> timeToReach(const ThreatState& threat, const Vec2& point, double radius);

/**
 * @brief Time of minimum distance between two unaccelerated bodies
 *
 * May be negative when the bodies are already separating.
 */
double timeOfClosestApproach(const Vec2& x1, const Vec2& v1, const Vec2& x2, const Vec2& v2);

/**
 * @brief Squared minimum distance between the infinite straight paths of two bodies
 */
double squaredClosestApproach(const Vec2& x1, const Vec2& v1, const Vec2& x2, const Vec2& v2);

/**
 * @brief Minimum distance between the infinite straight paths of two bodies
 */
double closestApproach(const Vec2& x1, const Vec2& v1, const Vec2& x2, const Vec2& v2);

/**
 * @brief Launch velocity for a stationary launcher to hit a moving target
 * @param launcher_position Launcher position
 * @param projectile_speed Projectile speed [m/s]
 * @param target_position Target position
 * @param target_velocity Target velocity
 * @return Earliest positive-time solution, nullopt if none exists
 */
std::optional<FiringSolution> firingSolution(const Vec2& launcher_position,
                                             double projectile_speed,
                                             const Vec2& target_position,
                                             const Vec2& target_velocity);

/**
 * @brief Assess every active threat against the aircraft
 * @param snapshot Current snapshot
 * @param danger_radius Radius used for the time-to-reach estimate [m]
 * @return One entry per active threat, most imminent first; equal times to
 *         reach are ordered by distance, threats that never reach the radius
 *         put closing ones before receding ones
 */
std::vector<ThreatAssessment> assessThreats(const Snapshot& snapshot, double danger_radius);

} // namespace evasion_control
