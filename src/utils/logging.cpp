#include "logging.hpp"
#include "../control/errors.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace evasion_control {
namespace logging {

namespace {

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stderr_color_mt(name);
        logger->set_level(spdlog::get_level());
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    return logger;
}

void setLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parseLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw InvalidArgument("Unknown log level: '" + name + "'");
    }
    return level;
}

} // namespace logging
} // namespace evasion_control
