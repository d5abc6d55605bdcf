#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace evasion_control {
namespace logging {

/**
 * @brief Get or create a named console logger
 * @param name Logger name, e.g. "evasion.optimizer"
 * @return Shared logger registered with spdlog
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

/**
 * @brief Set the level of every registered logger and of loggers created later
 */
void setLevel(spdlog::level::level_enum level);

/**
 * @brief Parse a level name (trace, debug, info, warn, error, critical, off)
 * @throws InvalidArgument for an unknown name
 */
spdlog::level::level_enum parseLevel(const std::string& name);

} // namespace logging
} // namespace evasion_control
