#pragma once

#include <stdexcept>
#include <string>

namespace evasion_control {

/**
 * @brief Malformed input: bad snapshot, bad configuration, negative time
 *
 * Fatal for the caller; never retried.
 */
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief The optimizer found no feasible plan within its restarts or time budget
 *
 * Recovered by EvasionController with a fallback acceleration.
 */
class OptimizationFailed : public std::runtime_error {
public:
    explicit OptimizationFailed(const std::string& what) : std::runtime_error(what) {}
};

} // namespace evasion_control
