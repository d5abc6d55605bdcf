#include "config_loader.hpp"
#include "../control/errors.hpp"
#include "../utils/logging.hpp"
#include <yaml-cpp/yaml.h>

namespace evasion_control {
namespace config {

namespace {

YAML::Node loadFile(const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw InvalidArgument("Cannot read configuration " + filename + ": " + e.what());
    }
    // An empty file holds no sections
    if (root.IsNull()) {
        return YAML::Node(YAML::NodeType::Map);
    }
    if (!root.IsMap()) {
        throw InvalidArgument("Configuration " + filename + " must be a map of sections");
    }
    return root;
}

template <typename T>
void readValue(const YAML::Node& node, const char* key, T& value) {
    const YAML::Node entry = node[key];
    if (!entry) {
        return;
    }
    try {
        value = entry.as<T>();
    } catch (const YAML::Exception& e) {
        throw InvalidArgument(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void readVector(const YAML::Node& node, const char* key, Vec2& value) {
    const YAML::Node entry = node[key];
    if (!entry) {
        return;
    }
    if (!entry.IsSequence() || entry.size() != 2) {
        throw InvalidArgument(std::string("'") + key + "' must be a list of two numbers");
    }
    try {
        value = Vec2(entry[0].as<double>(), entry[1].as<double>());
    } catch (const YAML::Exception& e) {
        throw InvalidArgument(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

sim::LauncherConfig parseLauncher(const YAML::Node& node, size_t index) {
    if (!node.IsMap()) {
        throw InvalidArgument("Launcher " + std::to_string(index + 1) + " must be a map");
    }
    sim::LauncherConfig launcher;
    launcher.name = "Launcher" + std::to_string(index + 1);
    readValue(node, "name", launcher.name);
    readVector(node, "position", launcher.position);
    readValue(node, "missile_speed", launcher.missile_speed);
    readValue(node, "explosion_range", launcher.explosion_range);
    readValue(node, "cooldown", launcher.cooldown);
    readValue(node, "firing_range", launcher.firing_range);
    readValue(node, "max_firing_angle", launcher.max_firing_angle);
    return launcher;
}

} // namespace

ControllerConfig parseControllerConfig(const YAML::Node& node) {
    ControllerConfig config;
    if (!node) {
        return config;
    }
    if (!node.IsMap()) {
        throw InvalidArgument("'controller' must be a map");
    }

    std::string objective = utils::objectiveName(config.objective);
    readValue(node, "objective", objective);
    config.objective = utils::parseObjectiveKind(objective);

    readValue(node, "horizon", config.horizon);
    readValue(node, "time_step", config.time_step);
    readValue(node, "max_accel", config.max_accel);
    readValue(node, "max_speed", config.max_speed);
    readValue(node, "survival_radius", config.survival_radius);
    readValue(node, "target_weight", config.target_weight);
    readValue(node, "solver_tolerance", config.solver_tolerance);
    readValue(node, "max_restarts", config.max_restarts);
    readValue(node, "time_budget", config.time_budget);
    readValue(node, "constraint_tolerance", config.constraint_tolerance);
    readValue(node, "max_iterations", config.max_iterations);
    readValue(node, "danger_radius", config.danger_radius);

    config.validate();
    return config;
}

ControllerConfig loadControllerConfig(const std::string& filename) {
    const YAML::Node root = loadFile(filename);
    return parseControllerConfig(root["controller"]);
}

sim::WorldConfig loadWorldConfig(const std::string& filename) {
    const YAML::Node root = loadFile(filename);
    sim::WorldConfig world = sim::WorldConfig::defaultScenario();

    const YAML::Node node = root["scenario"];
    if (!node) {
        return world;
    }
    if (!node.IsMap()) {
        throw InvalidArgument("'scenario' must be a map");
    }

    readVector(node, "lower_bound", world.lower_bound);
    readVector(node, "upper_bound", world.upper_bound);
    readValue(node, "t_max", world.t_max);
    readValue(node, "arrival_radius", world.arrival_radius);
    readVector(node, "aircraft_position", world.aircraft_position);
    readVector(node, "aircraft_velocity", world.aircraft_velocity);
    readVector(node, "target_position", world.target_position);

    const YAML::Node launchers = node["launchers"];
    if (launchers) {
        if (!launchers.IsSequence()) {
            throw InvalidArgument("'launchers' must be a list");
        }
        world.launchers.clear();
        for (size_t i = 0; i < launchers.size(); ++i) {
            world.launchers.push_back(parseLauncher(launchers[i], i));
        }
    }

    world.validate();
    return world;
}

spdlog::level::level_enum loadLogLevel(const std::string& filename) {
    const YAML::Node root = loadFile(filename);
    std::string level = "info";
    const YAML::Node node = root["logging"];
    if (node) {
        if (!node.IsMap()) {
            throw InvalidArgument("'logging' must be a map");
        }
        readValue(node, "level", level);
    }
    return logging::parseLevel(level);
}

} // namespace config
} // namespace evasion_control
