// src/core/FitnessEvaluator.hpp
//
// Declares the **ChatteringFitnessEvaluator**, the objective function that the
// swarm optimizer of the **ChatteringOptimizationEngine** minimises.
//
// Objective (lower is better):
//
//   fitness = chattering_index + penalty
//   penalty = 0                                            if rms <= threshold
//           = (rms - threshold) * penalty_scale            otherwise
//
// Chattering is the unconditional term; tracking accuracy only contributes
// when it violates the constraint. An objective of the form
// tracking + max(0, chattering - c) * s is flat wherever chattering is below c
// and tracking is near zero, which leaves the swarm without any signal.
//
// The evaluator is stateless: it calls the injected simulation once per
// candidate and reduces the returned trajectory. Simulation failures are
// reported as exceptions and never converted into a numeric fitness.
#ifndef FITNESS_EVALUATOR_HPP
#define FITNESS_EVALUATOR_HPP
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include "ChatteringMeasure.hpp"
#include "Trajectory.hpp"
#include "TunerConfig.hpp"

/**
 * @brief The simulation did not produce a finite, bounded trajectory.
 */
class SimulationDivergenceError : public std::runtime_error {
public:
    explicit SimulationDivergenceError(const std::string& what)
        : std::runtime_error("simulation diverged: " + what) {}
};

/**
 * @brief The simulation returned an empty control or state-error series.
 */
class EmptyTrajectoryError : public std::runtime_error {
public:
    explicit EmptyTrajectoryError(const std::string& what)
        : std::runtime_error("empty trajectory: " + what) {}
};

/// Closed-loop simulation collaborator: gains in, sampled trajectory out.
using SimulationFn = std::function<Trajectory(const GainVector&)>;

/**
 * @brief Fitness value together with the terms and diagnostics behind it.
 */
struct FitnessBreakdown {
    double chattering_index = 0.0;
    double tracking_rms = 0.0;
    double penalty = 0.0;
    double fitness = 0.0;
    double control_effort_rms = 0.0;
    double total_variation = 0.0;
    double smoothness_index = 0.0;  ///< 1 / (1 + total_variation)
};

/**
 * @brief Pass/fail flags of AcceptanceCriteria for one breakdown.
 */
struct AcceptanceReport {
    bool chattering = false;
    bool tracking = false;
    bool smoothness = false;

    size_t passed() const { return size_t(chattering) + size_t(tracking) + size_t(smoothness); }
    bool all() const { return chattering && tracking && smoothness; }
};

/**
 * @brief Constraint penalty for a tracking RMS value.
 *
 * @return double 0 when tracking_rms <= threshold, else
 * (tracking_rms - threshold) * penalty_scale.
 */
double computeConstraintPenalty(double tracking_rms, const FitnessConfig& cfg);

/**
 * @brief chattering_index + computeConstraintPenalty(tracking_rms, cfg).
 */
double combineFitness(double chattering_index, double tracking_rms, const FitnessConfig& cfg);

/**
 * @brief Applies AcceptanceCriteria to a fitness breakdown.
 */
AcceptanceReport checkAcceptance(const FitnessBreakdown& breakdown,
                                 const AcceptanceCriteria& criteria = AcceptanceCriteria{});

/**
 * @class ChatteringFitnessEvaluator
 * @brief Maps a candidate gain vector to a chattering-dominated fitness.
 *
 * Thread-safe for concurrent evaluate() calls as long as the injected
 * simulation is (either stateless or an isolated instance per evaluator).
 */
class ChatteringFitnessEvaluator {
public:
    /**
     * @brief Constructs the evaluator.
     *
     * @param cfg Objective parameters (validated here).
     * @param simulate Closed-loop simulation collaborator (must be callable).
     * @param measure Chattering measure; DerivativeRMSMeasure when null.
     * @throws std::invalid_argument for invalid configuration or empty simulate.
     */
    ChatteringFitnessEvaluator(FitnessConfig cfg, SimulationFn simulate,
                               std::shared_ptr<const ChatteringMeasure> measure = nullptr);

    /**
     * @brief Simulates the candidate and reduces its trajectory.
     *
     * Gains are passed to the simulation unchanged; bound handling belongs to
     * the optimizer.
     *
     * @throws SimulationDivergenceError when the simulation fails or returns a
     * non-finite or unbounded trajectory.
     * @throws EmptyTrajectoryError when a series is empty.
     */
    FitnessBreakdown evaluate(const GainVector& gains) const;

    /**
     * @brief Reduces an already simulated trajectory.
     *
     * Same checks and error reporting as evaluate().
     */
    FitnessBreakdown evaluateTrajectory(const Trajectory& traj) const;

    /// Scalar fitness of evaluate(gains).
    double operator()(const GainVector& gains) const { return evaluate(gains).fitness; }

    const FitnessConfig& config() const { return cfg_; }
    const ChatteringMeasure& measure() const { return *measure_; }

private:
    FitnessConfig cfg_;
    SimulationFn simulate_;
    std::shared_ptr<const ChatteringMeasure> measure_;
};

#endif // FITNESS_EVALUATOR_HPP
