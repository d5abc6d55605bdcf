#include <iostream>
#include <iomanip>
#include <string>
#include <chrono>
#include <exception>
#include <memory>
#include "../src/control/controller.hpp"
#include "../src/control/errors.hpp"
#include "../src/config/config_loader.hpp"
#include "../src/sim/world.hpp"
#include "../src/utils/logging.hpp"

using namespace evasion_control;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [config.yaml] [fuel|min_distance|next_distance|none]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::cout << "=== Missile Evasion Demo ===" << std::endl;
    std::cout << std::fixed << std::setprecision(3);

    ControllerConfig controller_config;
    sim::WorldConfig world_config = sim::WorldConfig::defaultScenario();

    try {
        if (argc >= 2) {
            std::string path = argv[1];
            logging::setLevel(config::loadLogLevel(path));
            controller_config = config::loadControllerConfig(path);
            world_config = config::loadWorldConfig(path);
        }
        // "none" flies straight for the target as a baseline
        bool evade = true;
        if (argc == 3) {
            std::string objective = argv[2];
            if (objective == "none") {
                evade = false;
            } else {
                controller_config.objective = utils::parseObjectiveKind(objective);
            }
        }

        std::shared_ptr<AircraftController> controller;
        if (evade) {
            controller = createEvasionController(controller_config);
        } else {
            controller = createTargetSeekingController(controller_config);
        }
        sim::World world(world_config, controller);

        std::cout << "\n--- Configuration ---" << std::endl;
        std::cout << "Objective: " << (evade ? utils::objectiveName(controller_config.objective) : "none")
                  << std::endl;
        std::cout << "Horizon: " << controller_config.horizon
                  << " ticks of " << controller_config.time_step << " s" << std::endl;
        std::cout << "Aircraft limits: max_speed " << controller_config.max_speed
                  << " m/s, max_accel " << controller_config.max_accel << " m/s^2" << std::endl;
        std::cout << "Survival radius [m]: " << controller_config.survival_radius << std::endl;
        std::cout << "Launchers: " << world_config.launchers.size() << std::endl;

        std::cout << "\n--- Initial State ---" << std::endl;
        std::cout << "Aircraft position [m]: (" << world.aircraft().position.transpose() << ")" << std::endl;
        std::cout << "Target position [m]: (" << world_config.target_position.transpose() << ")" << std::endl;

        auto start = std::chrono::high_resolution_clock::now();
        sim::RunSummary summary = world.run();
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        std::cout << "\n--- Run Summary ---" << std::endl;
        std::cout << "Outcome: " << sim::outcomeName(summary.outcome) << std::endl;
        std::cout << "Final time [s]: " << summary.time << std::endl;
        std::cout << "Ticks: " << summary.ticks << " (" << summary.degraded_ticks << " degraded)" << std::endl;
        std::cout << "Missiles fired: " << summary.missiles_fired << std::endl;
        std::cout << "Closest missile [m]: " << summary.min_separation << std::endl;
        std::cout << "Final distance to target [m]: " << summary.final_target_distance << std::endl;
        std::cout << "Aircraft position [m]: (" << world.aircraft().position.transpose() << ")" << std::endl;
        std::cout << "Wall time [ms]: " << duration.count() << std::endl;

        std::cout << "\n=== Demo completed ===" << std::endl;
        return summary.outcome == sim::RunOutcome::DESTROYED ? 2 : 0;
    } catch (const InvalidArgument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }
}
