#pragma once

#include "../control/types.hpp"
#include "../control/controller.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <spdlog/fwd.h>
#include <string>
#include <vector>

namespace evasion_control {
namespace sim {

/**
 * @brief Stationary launcher parameters
 */
struct LauncherConfig {
    std::string name;
    Vec2 position;              // [m]
    double missile_speed;       // [m/s]
    double explosion_range;     // Proximity fuze radius [m]
    double cooldown;            // Minimum time between launches [s]
    double firing_range;        // Maximum distance to the aircraft [m]
    double max_firing_angle;    // Maximum launch angle from the vertical [rad]

    LauncherConfig()
        : name("Launcher"), position(Vec2::Zero()), missile_speed(50.0), explosion_range(5.0),
          cooldown(2.0), firing_range(50.0), max_firing_angle(1.5) {}
};

/**
 * @brief Scenario of a headless run
 */
struct WorldConfig {
    Vec2 lower_bound;           // Theater lower corner [m]
    Vec2 upper_bound;           // Theater upper corner [m]
    double t_max;               // Run length [s]
    double arrival_radius;      // Distance at which the target counts as reached [m]
    Vec2 aircraft_position;
    Vec2 aircraft_velocity;
    Vec2 target_position;
    std::vector<LauncherConfig> launchers;

    WorldConfig()
        : lower_bound(0.0, 0.0), upper_bound(100.0, 100.0), t_max(20.0), arrival_radius(1.0),
          aircraft_position(25.0, 90.0), aircraft_velocity(Vec2::Zero()),
          target_position(50.0, 0.0) {}

    /**
     * @brief Two launchers guarding a target at the bottom of the theater
     */
    static WorldConfig defaultScenario();

    /**
     * @brief Check bounds, times and launcher parameters
     * @throws InvalidArgument for an invalid scenario
     */
    void validate() const;
};

/**
 * @brief Unguided missile with a proximity fuze
 */
struct UnguidedMissile {
    std::string name;
    Vec2 position;
    Vec2 velocity;
    double speed;
    double explosion_range;
    int launcher;               // Index of the owning launcher
    bool destroyed;
    bool exploded;

    UnguidedMissile()
        : position(Vec2::Zero()), velocity(Vec2::Zero()), speed(0.0), explosion_range(0.0),
          launcher(-1), destroyed(false), exploded(false) {}

    /**
     * @brief Threat seen by the controller, inactive once destroyed
     */
    ThreatState threatState() const;
};

/**
 * @brief Stationary launcher firing one missile at a time
 */
class MissileLauncher {
public:
    explicit MissileLauncher(const LauncherConfig& config);

    /**
     * @brief Check the cooldown and the absence of a live missile
     */
    bool readyToFire(double t) const;

    /**
     * @brief Check that the aircraft is within firing range
     */
    bool inRange(const Vec2& aircraft_position) const;

    /**
     * @brief Launch angle of a direction, measured from the vertical
     * @return Unsigned angle in [0, pi]
     */
    static double firingAngle(const Vec2& direction);

    /**
     * @brief Try to fire at a constant-velocity aircraft
     * @param aircraft_position Aircraft position
     * @param aircraft_velocity Aircraft velocity
     * @param t Current time [s]
     * @return Launched missile, nullopt without a solution within max_firing_angle
     */
    std::optional<UnguidedMissile> fire(const Vec2& aircraft_position, const Vec2& aircraft_velocity, double t);

    /**
     * @brief Forget the live missile after it was destroyed
     */
    void releaseMissile() { has_missile_ = false; }

    const LauncherConfig& getConfig() const { return config_; }
    bool hasMissile() const { return has_missile_; }
    int firedCount() const { return fired_count_; }

private:
    LauncherConfig config_;
    std::optional<double> last_fire_time_;
    bool has_missile_;
    int fired_count_;
};

/**
 * @brief Run state of a World
 */
enum class RunOutcome {
    RUNNING = 0,
    ARRIVED,                    // Aircraft within arrival_radius of the target
    DESTROYED,                  // A missile exploded next to the aircraft
    TIMEOUT                     // t_max elapsed
};

/**
 * @brief Totals of a finished run
 */
struct RunSummary {
    RunOutcome outcome;
    double time;
    long ticks;
    long degraded_ticks;
    int missiles_fired;
    double min_separation;      // Closest live missile over the run [m]
    double final_target_distance;
};

/**
 * @brief Headless world driving an aircraft with an AircraftController
 *
 * One tick, in order: the aircraft asks the controller for an acceleration
 * and moves; launchers self-destruct missiles that left their range and
 * fire when ready; missiles check their fuze, move and self-destruct on
 * leaving the theater.
 */
class World {
public:
    /**
     * @brief Constructor
     * @param config Scenario
     * @param controller Controller flying the aircraft; its config supplies dt and limits
     * @throws InvalidArgument for an invalid scenario or a null controller
     */
    World(const WorldConfig& config, std::shared_ptr<AircraftController> controller);

    /**
     * @brief Advance one tick
     * @return Outcome after the tick
     */
    RunOutcome step();

    /**
     * @brief Step until the run ends
     */
    RunSummary run();

    /**
     * @brief State handed to the controller
     */
    LiveState liveState() const;

    double time() const { return time_; }
    double timeStep() const { return dt_; }
    RunOutcome outcome() const { return outcome_; }
    const AircraftState& aircraft() const { return aircraft_; }
    const std::vector<UnguidedMissile>& missiles() const { return missiles_; }
    const std::vector<MissileLauncher>& launchers() const { return launchers_; }
    double minSeparation() const { return min_separation_; }

private:
    WorldConfig config_;
    std::shared_ptr<AircraftController> controller_;
    std::shared_ptr<spdlog::logger> logger_;

    double dt_;
    double time_;
    AircraftState aircraft_;
    bool aircraft_destroyed_;
    std::vector<MissileLauncher> launchers_;
    std::vector<UnguidedMissile> missiles_;
    RunOutcome outcome_;
    double min_separation_;
    long ticks_;

    void stepAircraft();
    void stepLaunchers();
    void stepMissiles();
    bool insideTheater(const Vec2& position) const;
};

/**
 * @brief Name of an outcome for reports
 */
std::string outcomeName(RunOutcome outcome);

} // namespace sim
} // namespace evasion_control
