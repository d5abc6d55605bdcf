#pragma once

#include "types.hpp"
#include <cmath>

namespace evasion_control {
namespace smooth {

/**
 * @brief Smooth approximation of the Euclidean norm
 * Uses sqrt(|v|^2 + eps^2) - eps, differentiable at the origin and exactly
 * zero there
 * @param v Vector
 * @param eps Smoothing radius (larger = rounder minimum)
 * @return Smooth norm
 */
inline double smooth_norm(const Vec2& v, double eps = 1e-2) {
    return std::sqrt(v.squaredNorm() + eps * eps) - eps;
}

/**
 * @brief Squared positive part, max(0, x)^2
 * @param x Input value
 * @return Penalty value
 */
inline double squared_hinge(double x) {
    return x > 0.0 ? x * x : 0.0;
}

} // namespace smooth
} // namespace evasion_control
