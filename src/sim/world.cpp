#include "world.hpp"
#include "../control/errors.hpp"
#include "../control/integrator.hpp"
#include "../control/threat_model.hpp"
#include "../utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace evasion_control {
namespace sim {

WorldConfig WorldConfig::defaultScenario() {
    WorldConfig config;

    LauncherConfig right;
    right.name = "Launcher1";
    right.position = Vec2(75.0, 0.0);
    config.launchers.push_back(right);

    LauncherConfig left;
    left.name = "Launcher2";
    left.position = Vec2(25.0, 0.0);
    config.launchers.push_back(left);

    return config;
}

void WorldConfig::validate() const {
    if (!utils::isFinite(lower_bound) || !utils::isFinite(upper_bound) ||
        !(lower_bound.array() < upper_bound.array()).all()) {
        throw InvalidArgument("Theater bounds must be finite with lower < upper");
    }
    if (!(t_max > 0.0) || !std::isfinite(t_max)) {
        throw InvalidArgument("t_max must be positive and finite");
    }
    if (!(arrival_radius >= 0.0) || !std::isfinite(arrival_radius)) {
        throw InvalidArgument("arrival_radius must be non-negative and finite");
    }
    if (!utils::isFinite(aircraft_position) || !utils::isFinite(aircraft_velocity) ||
        !utils::isFinite(target_position)) {
        throw InvalidArgument("Aircraft and target states must be finite");
    }
    for (const auto& launcher : launchers) {
        if (!utils::isFinite(launcher.position)) {
            throw InvalidArgument("Launcher " + launcher.name + ": position must be finite");
        }
        if (!(launcher.missile_speed > 0.0) || !(launcher.explosion_range >= 0.0) ||
            !(launcher.cooldown >= 0.0) || !(launcher.firing_range > 0.0) ||
            !(launcher.max_firing_angle >= 0.0)) {
            throw InvalidArgument("Launcher " + launcher.name + ": invalid parameters");
        }
    }
}

ThreatState UnguidedMissile::threatState() const {
    return ThreatState(position, velocity, speed, !destroyed);
}

// MissileLauncher implementation
MissileLauncher::MissileLauncher(const LauncherConfig& config)
    : config_(config), has_missile_(false), fired_count_(0) {
}

bool MissileLauncher::readyToFire(double t) const {
    if (has_missile_) {
        return false;
    }
    return !last_fire_time_ || t >= *last_fire_time_ + config_.cooldown;
}

bool MissileLauncher::inRange(const Vec2& aircraft_position) const {
    return (aircraft_position - config_.position).norm() <= config_.firing_range;
}

double MissileLauncher::firingAngle(const Vec2& direction) {
    Vec2 vertical(0.0, 1.0);
    double cross = vertical.x() * direction.y() - vertical.y() * direction.x();
    return std::atan2(std::abs(cross), vertical.dot(direction));
}

std::optional<UnguidedMissile> MissileLauncher::fire(const Vec2& aircraft_position,
                                                     const Vec2& aircraft_velocity, double t) {
    auto solution = firingSolution(config_.position, config_.missile_speed,
                                   aircraft_position, aircraft_velocity);
    if (!solution) {
        return std::nullopt;
    }
    if (firingAngle(solution->velocity) > config_.max_firing_angle) {
        return std::nullopt;
    }

    UnguidedMissile missile;
    missile.name = config_.name + ".Missile" + std::to_string(fired_count_);
    missile.position = config_.position;
    missile.velocity = solution->velocity;
    missile.speed = config_.missile_speed;
    missile.explosion_range = config_.explosion_range;

    last_fire_time_ = t;
    has_missile_ = true;
    ++fired_count_;
    return missile;
}

// World implementation
World::World(const WorldConfig& config, std::shared_ptr<AircraftController> controller)
    : config_(config), controller_(std::move(controller)),
      logger_(logging::getLogger("evasion.sim")),
      time_(0.0), aircraft_destroyed_(false), outcome_(RunOutcome::RUNNING),
      min_separation_(std::numeric_limits<double>::infinity()), ticks_(0) {
    if (!controller_) {
        throw InvalidArgument("World requires a controller");
    }
    config_.validate();

    const ControllerConfig& controller_config = controller_->getConfig();
    dt_ = controller_config.time_step;
    aircraft_ = AircraftState(config_.aircraft_position,
                              utils::clampNorm(config_.aircraft_velocity, controller_config.max_speed),
                              controller_config.max_speed, controller_config.max_accel);

    for (const auto& launcher : config_.launchers) {
        launchers_.emplace_back(launcher);
    }
}

LiveState World::liveState() const {
    LiveState live;
    live.aircraft = aircraft_;
    live.target = TargetState(config_.target_position);
    for (const auto& missile : missiles_) {
        if (!missile.destroyed) {
            live.threats.push_back(missile.threatState());
        }
    }
    return live;
}

RunOutcome World::step() {
    if (outcome_ != RunOutcome::RUNNING) {
        return outcome_;
    }

    time_ += dt_;
    ++ticks_;

    stepAircraft();
    stepLaunchers();
    stepMissiles();

    for (const auto& missile : missiles_) {
        if (!missile.destroyed) {
            min_separation_ = std::min(min_separation_, (missile.position - aircraft_.position).norm());
        }
    }

    if (aircraft_destroyed_) {
        outcome_ = RunOutcome::DESTROYED;
    } else if ((aircraft_.position - config_.target_position).norm() <= config_.arrival_radius) {
        outcome_ = RunOutcome::ARRIVED;
    } else if (time_ >= config_.t_max) {
        outcome_ = RunOutcome::TIMEOUT;
    }

    if (outcome_ != RunOutcome::RUNNING) {
        logger_->info("Run finished at t={:.2f}: {}", time_, outcomeName(outcome_));
    }
    return outcome_;
}

RunSummary World::run() {
    while (step() == RunOutcome::RUNNING) {
    }

    RunSummary summary;
    summary.outcome = outcome_;
    summary.time = time_;
    summary.ticks = ticks_;
    summary.degraded_ticks = controller_->degradedTickCount();
    summary.missiles_fired = 0;
    for (const auto& launcher : launchers_) {
        summary.missiles_fired += launcher.firedCount();
    }
    summary.min_separation = min_separation_;
    summary.final_target_distance = (aircraft_.position - config_.target_position).norm();
    return summary;
}

void World::stepAircraft() {
    if (aircraft_destroyed_) {
        return;
    }
    ControlDecision accel = controller_->nextAcceleration(liveState());
    aircraft_ = integrateStep(aircraft_, accel, dt_);
    logger_->debug("t={:.2f} aircraft x=({:.2f}, {:.2f}) v=({:.2f}, {:.2f})", time_,
                   aircraft_.position.x(), aircraft_.position.y(),
                   aircraft_.velocity.x(), aircraft_.velocity.y());
}

void World::stepLaunchers() {
    for (size_t i = 0; i < launchers_.size(); ++i) {
        MissileLauncher& launcher = launchers_[i];

        if (launcher.hasMissile()) {
            for (auto& missile : missiles_) {
                if (missile.launcher != static_cast<int>(i) || missile.destroyed) {
                    continue;
                }
                if (!launcher.inRange(missile.position)) {
                    missile.destroyed = true;
                    missile.velocity = Vec2::Zero();
                    logger_->info("{} left the firing range, self-destruct", missile.name);
                }
            }
            bool live = false;
            for (const auto& missile : missiles_) {
                live = live || (missile.launcher == static_cast<int>(i) && !missile.destroyed);
            }
            if (!live) {
                launcher.releaseMissile();
            }
        }

        if (aircraft_destroyed_ || !launcher.readyToFire(time_) || !launcher.inRange(aircraft_.position)) {
            continue;
        }
        auto missile = launcher.fire(aircraft_.position, aircraft_.velocity, time_);
        if (missile) {
            missile->launcher = static_cast<int>(i);
            logger_->info("t={:.2f} {} launched {} v=({:.2f}, {:.2f})", time_,
                          launcher.getConfig().name, missile->name,
                          missile->velocity.x(), missile->velocity.y());
            missiles_.push_back(*missile);
        }
    }
}

void World::stepMissiles() {
    for (auto& missile : missiles_) {
        if (missile.destroyed) {
            continue;
        }
        if (!aircraft_destroyed_ &&
            (missile.position - aircraft_.position).norm() <= missile.explosion_range) {
            missile.exploded = true;
            missile.destroyed = true;
            missile.velocity = Vec2::Zero();
            aircraft_destroyed_ = true;
            aircraft_.velocity = Vec2::Zero();
            logger_->info("t={:.2f} {} exploded, aircraft destroyed", time_, missile.name);
            continue;
        }

        missile.position += missile.velocity * dt_;
        if (!insideTheater(missile.position)) {
            missile.destroyed = true;
            missile.velocity = Vec2::Zero();
            logger_->info("{} left the theater, self-destruct", missile.name);
        }
    }
}

bool World::insideTheater(const Vec2& position) const {
    return (position.array() >= config_.lower_bound.array()).all() &&
           (position.array() <= config_.upper_bound.array()).all();
}

std::string outcomeName(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::RUNNING:
            return "running";
        case RunOutcome::ARRIVED:
            return "arrived";
        case RunOutcome::DESTROYED:
            return "destroyed";
        case RunOutcome::TIMEOUT:
            return "timeout";
        default:
            return "unknown";
    }
}

} // namespace sim
} // namespace evasion_control
