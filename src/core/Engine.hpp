// src/core/Engine.hpp
//
// Declares the **SwarmOptimizer** facade and the batch evaluation strategies
// of the **ChatteringOptimizationEngine** framework.
//
// This file implements the **Strategy Design Pattern** for candidate
// evaluation:
// • **Polymorphic interchangeability** of execution back-ends (sequential,
//   ThreadPool, OpenMP) at runtime.
// • **Clean separation** between the PSO search logic and the way fitness
//   evaluations are scheduled.
//
// `SwarmOptimizer` serves as a **Facade**: it owns one evaluation strategy,
// runs global-best PSO over a controller's gain bounds, and returns an
// `OptimizationResult` with the best gains, cost history and diagnostics.
// The `createEvaluationStrategy` factory maps a mode string to a strategy for
// the Python bindings and the tuning campaign.
//
// Per-candidate failures (`SimulationDivergenceError`, `EmptyTrajectoryError`)
// are reported to the optimizer as failed outcomes; the optimizer decides how
// to score them. Every other exception propagates.
#ifndef ENGINE_HPP
#define ENGINE_HPP
#include <memory>
#include <string>
#include <vector>
#include "FitnessEvaluator.hpp"
#include "ThreadPool.hpp"
#include "TunerConfig.hpp"

/**
 * @brief Result of evaluating one candidate.
 */
struct EvaluationOutcome {
    bool ok = false;
    FitnessBreakdown breakdown;  ///< Valid when ok.
    std::string error;           ///< Failure message when !ok.
};

/**
 * @brief Evaluates one candidate, turning per-candidate failures into outcomes.
 */
EvaluationOutcome evaluateCandidate(const ChatteringFitnessEvaluator& evaluator,
                                    const GainVector& gains);

/**
 * @brief Abstract base class defining the batch evaluation interface.
 */
class EvaluationStrategy {
public:
    virtual ~EvaluationStrategy() = default;
    /**
     * @brief Evaluates every candidate of one swarm iteration.
     *
     * @param evaluator Shared, const objective.
     * @param candidates Gain vectors to evaluate.
     * @return std::vector<EvaluationOutcome> One outcome per candidate, in order.
     */
    virtual std::vector<EvaluationOutcome> evaluateBatch(const ChatteringFitnessEvaluator& evaluator,
                                                         const std::vector<GainVector>& candidates) = 0;
    /// Mode name as accepted by createEvaluationStrategy().
    virtual std::string name() const = 0;
};

/**
 * @brief Evaluates candidates one after another on the calling thread.
 *
 * Baseline back-end; required when the simulation is not thread-safe.
 */
class SequentialEvaluationStrategy : public EvaluationStrategy {
public:
    std::vector<EvaluationOutcome> evaluateBatch(const ChatteringFitnessEvaluator& evaluator,
                                                 const std::vector<GainVector>& candidates) override;
    std::string name() const override { return "sequential"; }
};

/**
 * @brief Evaluates candidates as tasks of a reusable ThreadPool.
 *
 * The pool is created once with the strategy and reused for every iteration.
 */
class ThreadPoolEvaluationStrategy : public EvaluationStrategy {
public:
    explicit ThreadPoolEvaluationStrategy(size_t threads = std::thread::hardware_concurrency());
    std::vector<EvaluationOutcome> evaluateBatch(const ChatteringFitnessEvaluator& evaluator,
                                                 const std::vector<GainVector>& candidates) override;
    std::string name() const override { return "threadpool"; }
    size_t thread_count() const { return pool_.thread_count(); }
private:
    ThreadPool pool_;
};

/**
 * @brief Evaluates candidates with an OpenMP parallel loop.
 *
 * Dynamic scheduling absorbs uneven simulation times (early divergence).
 */
class OpenMPEvaluationStrategy : public EvaluationStrategy {
public:
    std::vector<EvaluationOutcome> evaluateBatch(const ChatteringFitnessEvaluator& evaluator,
                                                 const std::vector<GainVector>& candidates) override;
    std::string name() const override { return "openmp"; }
};

/**
 * @brief Factory for evaluation strategies.
 *
 * @param mode "sequential" (alias "cpu"), "threadpool" or "openmp".
 * @throws std::invalid_argument for unknown modes.
 */
std::unique_ptr<EvaluationStrategy> createEvaluationStrategy(const std::string& mode);

/**
 * @brief Outcome of one swarm optimisation run.
 */
struct OptimizationResult {
    ControllerType controller = ControllerType::Classical;
    GainVector best_gains;
    double best_fitness = 0.0;
    FitnessBreakdown best_breakdown;
    AcceptanceReport acceptance;
    std::vector<double> cost_history;  ///< Global best after each iteration (index 0: initial swarm).
    size_t iterations = 0;             ///< PSO update steps performed.
    size_t evaluations = 0;
    size_t failed_evaluations = 0;
    double time_taken = 0.0;           ///< Wall-clock seconds.
    std::string strategy;
    std::vector<std::string> warnings;
};

/**
 * @brief Facade running global-best PSO with a pluggable evaluation strategy.
 *
 * Swarm state and the random generator live on the calling thread; only
 * fitness evaluations are distributed. For a deterministic simulation the
 * result is therefore identical for every strategy.
 */
class SwarmOptimizer {
public:
    /**
     * @brief Constructs the optimizer.
     *
     * @param profile Controller gain bounds (validated here).
     * @param cfg PSO hyper-parameters (validated here).
     * @param strategy Evaluation back-end; SequentialEvaluationStrategy when null.
     */
    SwarmOptimizer(ControllerProfile profile, SwarmConfig cfg,
                   std::unique_ptr<EvaluationStrategy> strategy = nullptr);

    /**
     * @brief Runs the optimisation against an evaluator.
     *
     * Failed evaluations are counted and excluded from personal bests and
     * flat-fitness monitoring; they never attract the swarm or become the
     * reported best. SwarmConfig::failure_fitness stands in for the cost
     * history until the first evaluation succeeds.
     *
     * @throws std::runtime_error when no evaluation succeeded.
     */
    OptimizationResult run(const ChatteringFitnessEvaluator& evaluator);

    const ControllerProfile& profile() const { return profile_; }
    const SwarmConfig& config() const { return cfg_; }
    const EvaluationStrategy& strategy() const { return *strategy_; }

private:
    ControllerProfile profile_;
    SwarmConfig cfg_;
    std::unique_ptr<EvaluationStrategy> strategy_;
};

#endif // ENGINE_HPP
