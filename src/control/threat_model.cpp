#include "threat_model.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace evasion_control {

Vec2 predict(const ThreatState& threat, double dt) {
    if (dt < 0.0 || std::isnan(dt)) {
        throw InvalidArgument("Prediction time must be non-negative");
    }
    return threat.position + utils::heading(threat.velocity) * (threat.speed * dt);
}

std::optional<double> timeToReach(const ThreatState& threat, const Vec2& point, double radius) {
    Vec2 d = threat.position - point;
    double c = d.squaredNorm() - radius * radius;
    if (c <= 0.0) {
        return 0.0;
    }

    Vec2 w = utils::heading(threat.velocity) * threat.speed;
    double a = w.squaredNorm();
    if (a == 0.0) {
        return std::nullopt;
    }

    // |d + w t|^2 = r^2; with c > 0 both roots share a sign
    double b = 2.0 * d.dot(w);
    double disc = b * b - 4.0 * a * c;
    if (disc < 0.0) {
        return std::nullopt;
    }
    double t = (-b - std::sqrt(disc)) / (2.0 * a);
    if (t < 0.0) {
        return std::nullopt;
    }
    return t;
}

double timeOfClosestApproach(const Vec2& x1, const Vec2& v1, const Vec2& x2, const Vec2& v2) {
    Vec2 dv = v1 - v2;
    double dvsq = dv.squaredNorm();
    if (dvsq == 0.0) {
        return 0.0;
    }
    return -dv.dot(x1 - x2) / dvsq;
}

double squaredClosestApproach(const Vec2& x1, const Vec2& v1, const Vec2& x2, const Vec2& v2) {
    Vec2 dv = v1 - v2;
    Vec2 dx = x1 - x2;
    double dvsq = dv.squaredNorm();
    if (dvsq == 0.0) {
        return dx.squaredNorm();
    }
    double cross = dv.x() * dx.y() - dv.y() * dx.x();
    return cross * cross / dvsq;
}

double closestApproach(const Vec2& x1, const Vec2& v1, const Vec2& x2, const Vec2& v2) {
    return std::sqrt(squaredClosestApproach(x1, v1, x2, v2));
}

std::optional<FiringSolution> firingSolution(const Vec2& launcher_position,
                                             double projectile_speed,
                                             const Vec2& target_position,
                                             const Vec2& target_velocity) {
    Vec2 d = target_position - launcher_position;
    double dsq = d.squaredNorm();
    if (dsq == 0.0 || projectile_speed <= 0.0) {
        return std::nullopt;
    }

    // |d + vt t| = s t  =>  (|vt|^2 - s^2) t^2 + 2 (d.vt) t + |d|^2 = 0
    double a = target_velocity.squaredNorm() - projectile_speed * projectile_speed;
    double b = 2.0 * d.dot(target_velocity);
    std::vector<double> roots;
    if (std::abs(a) < 1e-12) {
        if (b != 0.0) {
            roots.push_back(-dsq / b);
        }
    } else {
        double disc = b * b - 4.0 * a * dsq;
        if (disc < 0.0) {
            return std::nullopt;
        }
        double sqrt_disc = std::sqrt(disc);
        roots.push_back((-b - sqrt_disc) / (2.0 * a));
        roots.push_back((-b + sqrt_disc) / (2.0 * a));
    }

    std::optional<double> best;
    for (double t : roots) {
        if (t > 0.0 && (!best || t < *best)) {
            best = t;
        }
    }
    if (!best) {
        return std::nullopt;
    }

    FiringSolution solution;
    solution.time = *best;
    solution.velocity = (d + target_velocity * solution.time) / solution.time;
    return solution;
}

std::vector<ThreatAssessment> assessThreats(const Snapshot& snapshot, double danger_radius) {
    std::vector<ThreatAssessment> assessments;
    const Vec2& x = snapshot.aircraft.position;
    const Vec2& v = snapshot.aircraft.velocity;

    for (size_t i = 0; i < snapshot.threats.size(); ++i) {
        const ThreatState& threat = snapshot.threats[i];
        if (!threat.active) {
            continue;
        }
        Vec2 threat_v = utils::heading(threat.velocity) * threat.speed;

        ThreatAssessment a;
        a.index = static_cast<int>(i);
        a.distance = (threat.position - x).norm();
        a.time_to_reach = timeToReach(threat, x, danger_radius);
        a.closest_approach = closestApproach(x, v, threat.position, threat_v);
        a.closest_approach_time = timeOfClosestApproach(x, v, threat.position, threat_v);
        assessments.push_back(a);
    }

    // Soonest to reach the danger radius first, then closing before receding
    // threats, then nearest
    std::sort(assessments.begin(), assessments.end(),
              [](const ThreatAssessment& lhs, const ThreatAssessment& rhs) {
                  if (lhs.time_to_reach && rhs.time_to_reach) {
                      if (*lhs.time_to_reach != *rhs.time_to_reach) {
                          return *lhs.time_to_reach < *rhs.time_to_reach;
                      }
                      return lhs.distance < rhs.distance;
                  }
                  if (lhs.time_to_reach || rhs.time_to_reach) {
                      return static_cast<bool>(lhs.time_to_reach);
                  }
                  if (lhs.receding() != rhs.receding()) {
                      return rhs.receding();
                  }
                  return lhs.distance < rhs.distance;
              });
    return assessments;
}

} // namespace evasion_control
