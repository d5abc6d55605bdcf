#pragma once

#include "../control/controller.hpp"
#include "../sim/world.hpp"
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>
#include <string>

namespace evasion_control {
namespace config {

/**
 * @brief Load controller configuration from a YAML file
 *
 * Reads the `controller:` map. Missing keys keep their defaults.
 *
 * @param filename Path to the YAML file
 * @return Validated configuration
 * @throws InvalidArgument if the file cannot be parsed or a value is invalid
 */
ControllerConfig loadControllerConfig(const std::string& filename);

/**
 * @brief Load a scenario from the `scenario:` map of a YAML file
 *
 * Without the map the default two-launcher scenario is returned. A
 * `launchers:` list replaces the default launchers.
 *
 * @throws InvalidArgument if the file cannot be parsed or a value is invalid
 */
sim::WorldConfig loadWorldConfig(const std::string& filename);

/**
 * @brief Log level from the `logging: level:` entry, info when absent
 */
spdlog::level::level_enum loadLogLevel(const std::string& filename);

/**
 * @brief Parse a controller map
 * @param node YAML map with controller keys
 * @return Validated configuration
 */
ControllerConfig parseControllerConfig(const YAML::Node& node);

} // namespace config
} // namespace evasion_control
