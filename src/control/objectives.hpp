#pragma once

#include "types.hpp"
#include "integrator.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace evasion_control {

/**
 * @brief Base class for plan scoring strategies
 *
 * score() rolls the plan forward with integrateStep() and returns a value to
 * be minimized. Every strategy adds target_weight * |x_H - target_H| so that
 * minimizing it still makes progress toward the target.
 */
class Objective {
public:
    /**
     * @brief Constructor
     * @param kind Strategy tag
     * @param target_weight Weight of the final distance to the target
     */
    Objective(ObjectiveKind kind, double target_weight);

    /**
     * @brief Destructor
     */
    virtual ~Objective() = default;

    /**
     * @brief Score a control plan, lower is better
     * @param snapshot Snapshot of the solve
     * @param controls Flattened plan, 2 scalars per tick
     * @return Objective value
     */
    virtual double score(const Snapshot& snapshot, const Eigen::VectorXd& controls) const = 0;

    ObjectiveKind kind() const { return kind_; }
    double getTargetWeight() const { return target_weight_; }

protected:
    /**
     * @brief Weighted smoothed distance between the last rollout point and the target
     */
    double targetTerm(const Snapshot& snapshot, const Trajectory& trajectory) const;

private:
    ObjectiveKind kind_;
    double target_weight_;
};

/**
 * @brief Control effort: sum of squared acceleration magnitudes
 *
 * Threats are kept away only through the survival constraint.
 */
class FuelObjective : public Objective {
public:
    explicit FuelObjective(double target_weight);

    double score(const Snapshot& snapshot, const Eigen::VectorXd& controls) const override;
};

/**
 * @brief Negative worst separation over all horizon ticks and active threats
 */
class MinDistanceObjective : public Objective {
public:
    explicit MinDistanceObjective(double target_weight);

    double score(const Snapshot& snapshot, const Eigen::VectorXd& controls) const override;
};

/**
 * @brief Negative worst separation at the next tick only
 *
 * Threat positions after the first tick never influence the score.
 */
class NextDistanceObjective : public Objective {
public:
    explicit NextDistanceObjective(double target_weight);

    double score(const Snapshot& snapshot, const Eigen::VectorXd& controls) const override;
};

/**
 * @brief Minimum separation between a rollout and the predicted threats
 * @param trajectory Aircraft rollout
 * @param threat_paths Output of predictThreatPaths
 * @param first_tick First tick considered
 * @param last_tick Last tick considered
 * @return Minimum distance [m], +infinity without active threats
 */
double minimumSeparation(const Trajectory& trajectory,
                         const std::vector<std::vector<Vec2>>& threat_paths,
                         int first_tick, int last_tick);

/**
 * @brief Last tick whose threat separation an objective observes
 *
 * Also the range of the survival constraint: 1 for NEXT_DISTANCE, the whole
 * horizon otherwise.
 */
int observedTicks(ObjectiveKind kind, int horizon);

/**
 * @brief Factory function to create an objective
 * @param kind Strategy tag
 * @param target_weight Weight of the final distance to the target
 * @return Shared pointer to the objective
 */
std::shared_ptr<Objective> createObjective(ObjectiveKind kind, double target_weight);

} // namespace evasion_control
