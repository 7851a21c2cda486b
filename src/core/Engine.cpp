// src/core/Engine.cpp
//
// Implements the **SwarmOptimizer** facade and the batch evaluation strategies
// of the **ChatteringOptimizationEngine** framework.
//
// This file provides:
// • Three evaluation back-ends (sequential, reusable `ThreadPool`, OpenMP)
//   that share `evaluateCandidate` so failure handling is identical.
// • Global-best PSO over a controller's gain box:
//   \( v \leftarrow w v + c_1 r_1 (p - x) + c_2 r_2 (g - x) \),
//   \( x \leftarrow \Pi_{[l,u]}(x + v) \), optional velocity clamp and linear
//   inertia schedule, early stop after `patience` stagnant iterations.
// • Wall-clock timing with `std::chrono::high_resolution_clock`.
#include "Engine.hpp"
#include "FitnessMonitor.hpp"
#include "Particle.hpp"
#include "util.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <iostream>
#include <limits>
#include <omp.h>
#include <random>
#include <stdexcept>

EvaluationOutcome evaluateCandidate(const ChatteringFitnessEvaluator& evaluator,
                                    const GainVector& gains) {
    EvaluationOutcome out;
    try {
        out.breakdown = evaluator.evaluate(gains);
        out.ok = true;
    } catch (const SimulationDivergenceError& e) {
        out.error = e.what();
    } catch (const EmptyTrajectoryError& e) {
        out.error = e.what();
    }
    return out;
}

/* ============================ EVALUATION STRATEGIES ============================ */

std::vector<EvaluationOutcome> SequentialEvaluationStrategy::evaluateBatch(
        const ChatteringFitnessEvaluator& evaluator, const std::vector<GainVector>& candidates) {
    std::vector<EvaluationOutcome> outcomes;
    outcomes.reserve(candidates.size());
    for (const auto& gains : candidates) {
        outcomes.push_back(evaluateCandidate(evaluator, gains));
    }
    return outcomes;
}

ThreadPoolEvaluationStrategy::ThreadPoolEvaluationStrategy(size_t threads) : pool_(threads) {}

/**
 * @brief One pool task per candidate; results gathered through futures.
 *
 * Every future is drained before an unexpected exception is rethrown, so no
 * task outlives the evaluator and candidate references it captured.
 */
std::vector<EvaluationOutcome> ThreadPoolEvaluationStrategy::evaluateBatch(
        const ChatteringFitnessEvaluator& evaluator, const std::vector<GainVector>& candidates) {
    std::vector<std::future<EvaluationOutcome>> futures;
    futures.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        futures.push_back(pool_.enqueue([&evaluator, &candidates, i]() {
            return evaluateCandidate(evaluator, candidates[i]);
        }));
    }
    std::vector<EvaluationOutcome> outcomes(candidates.size());
    std::exception_ptr first_error;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            outcomes[i] = futures[i].get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
    return outcomes;
}

/**
 * @brief OpenMP parallel loop over candidates.
 *
 * Exceptions may not leave an OpenMP region; unexpected ones are captured per
 * candidate and the first is rethrown after the region.
 */
std::vector<EvaluationOutcome> OpenMPEvaluationStrategy::evaluateBatch(
        const ChatteringFitnessEvaluator& evaluator, const std::vector<GainVector>& candidates) {
    const long n = static_cast<long>(candidates.size());
    std::vector<EvaluationOutcome> outcomes(candidates.size());
    std::vector<std::exception_ptr> errors(candidates.size());
#pragma omp parallel for schedule(dynamic)
    for (long i = 0; i < n; ++i) {
        try {
            outcomes[i] = evaluateCandidate(evaluator, candidates[i]);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }
    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
    return outcomes;
}

std::unique_ptr<EvaluationStrategy> createEvaluationStrategy(const std::string& mode) {
    if (mode == "sequential" || mode == "cpu") {
        return std::make_unique<SequentialEvaluationStrategy>();
    }
    if (mode == "threadpool") {
        return std::make_unique<ThreadPoolEvaluationStrategy>();
    }
    if (mode == "openmp") {
        return std::make_unique<OpenMPEvaluationStrategy>();
    }
    throw std::invalid_argument("Unknown evaluation mode: " + mode);
}

/* =============================== SWARM OPTIMIZER =============================== */

SwarmOptimizer::SwarmOptimizer(ControllerProfile profile, SwarmConfig cfg,
                               std::unique_ptr<EvaluationStrategy> strategy)
    : profile_(std::move(profile)), cfg_(cfg), strategy_(std::move(strategy)) {
    validate(profile_);
    validate(cfg_);
    if (!strategy_) strategy_ = std::make_unique<SequentialEvaluationStrategy>();
}

/**
 * @brief Runs global-best PSO and reports the best successful candidate.
 *
 * Iteration 0 evaluates the initial swarm; iterations 1..N move and
 * re-evaluate it. The social attractor is the best successful position; until
 * one exists, the best personal best is used (a particle without a successful
 * evaluation keeps its initial position with infinite fitness).
 */
OptimizationResult SwarmOptimizer::run(const ChatteringFitnessEvaluator& evaluator) {
    auto start = std::chrono::high_resolution_clock::now();
    const size_t dims = profile_.gainCount();
    const std::string label = toString(profile_.type);

    std::mt19937 gen(cfg_.seed);
    std::uniform_real_distribution<double> unit(-1.0, 1.0);
    std::vector<double> width(dims), max_speed;
    for (size_t i = 0; i < dims; ++i) width[i] = profile_.upper[i] - profile_.lower[i];
    if (cfg_.velocity_clamp > 0.0) {
        max_speed.resize(dims);
        for (size_t i = 0; i < dims; ++i) max_speed[i] = cfg_.velocity_clamp * width[i];
    }

    std::vector<Particle> swarm;
    swarm.reserve(cfg_.n_particles);
    for (auto& pos : generateSwarm(profile_.lower, profile_.upper, cfg_.n_particles, gen)) {
        GainVector vel(dims);
        for (size_t i = 0; i < dims; ++i) vel[i] = 0.1 * width[i] * unit(gen);
        swarm.emplace_back(std::move(pos), std::move(vel));
    }

    OptimizationResult result;
    result.controller = profile_.type;
    result.strategy = strategy_->name();
    FitnessMonitor monitor(0.5, 4, cfg_.verbose);

    bool have_best = false;
    double best_fitness = std::numeric_limits<double>::infinity();
    GainVector best_gains;
    FitnessBreakdown best_breakdown;

    auto evaluateSwarm = [&](size_t iteration) {
        std::vector<GainVector> candidates;
        candidates.reserve(swarm.size());
        for (const auto& p : swarm) candidates.push_back(p.position);
        std::vector<EvaluationOutcome> outcomes = strategy_->evaluateBatch(evaluator, candidates);

        std::vector<double> successful;
        successful.reserve(outcomes.size());
        for (size_t i = 0; i < outcomes.size(); ++i) {
            if (outcomes[i].ok) {
                const double fitness = outcomes[i].breakdown.fitness;
                successful.push_back(fitness);
                swarm[i].recordFitness(fitness);
                if (fitness < best_fitness) {
                    best_fitness = fitness;
                    best_gains = candidates[i];
                    best_breakdown = outcomes[i].breakdown;
                    have_best = true;
                }
            } else {
                // Failures never enter a personal best; failure_fitness is reporting only.
                ++result.failed_evaluations;
                if (cfg_.verbose) {
                    std::cerr << "[SwarmOptimizer] " << label << " iteration " << iteration
                              << " particle " << i << " failed: " << outcomes[i].error << std::endl;
                }
            }
        }
        result.evaluations += outcomes.size();
        monitor.recordIteration(iteration, successful);
    };

    auto socialAttractor = [&]() -> const GainVector& {
        if (have_best) return best_gains;
        size_t idx = 0;
        for (size_t i = 1; i < swarm.size(); ++i) {
            if (swarm[i].best_fitness < swarm[idx].best_fitness) idx = i;
        }
        return swarm[idx].best_position;
    };

    auto recordHistory = [&]() {
        const double value = have_best ? best_fitness : cfg_.failure_fitness;
        result.cost_history.push_back(value);
        monitor.recordBest(value);
    };

    evaluateSwarm(0);
    recordHistory();

    const size_t log_every = std::max<size_t>(1, cfg_.iterations / 10);
    size_t stagnant = 0;
    for (size_t it = 1; it <= cfg_.iterations; ++it) {
        VelocityWeights weights{cfg_.w, cfg_.c1, cfg_.c2};
        if (cfg_.use_w_schedule && cfg_.iterations > 1) {
            const double frac = static_cast<double>(it - 1) / static_cast<double>(cfg_.iterations - 1);
            weights.w = cfg_.w + (cfg_.w_end - cfg_.w) * frac;
        }
        const GainVector attractor = socialAttractor();
        for (auto& p : swarm) {
            p.updateVelocity(attractor, weights, max_speed, gen);
            p.move(profile_.lower, profile_.upper);
        }

        const double previous = result.cost_history.back();
        evaluateSwarm(it);
        recordHistory();
        result.iterations = it;

        if (cfg_.verbose && (it % log_every == 0 || it == cfg_.iterations)) {
            std::cout << "[SwarmOptimizer] " << label << " iteration " << it << "/"
                      << cfg_.iterations << " best fitness " << result.cost_history.back()
                      << std::endl;
        }
        if (cfg_.patience > 0) {
            stagnant = (previous - result.cost_history.back() <= cfg_.tolerance) ? stagnant + 1 : 0;
            if (stagnant >= cfg_.patience) {
                if (cfg_.verbose) {
                    std::cout << "[SwarmOptimizer] " << label << " stopped early after "
                              << it << " iterations" << std::endl;
                }
                break;
            }
        }
    }
    monitor.finish();

    if (!have_best) {
        throw std::runtime_error("SwarmOptimizer: all " + std::to_string(result.evaluations) +
                                 " evaluations failed for " + label);
    }
    result.best_gains = best_gains;
    result.best_fitness = best_fitness;
    result.best_breakdown = best_breakdown;
    result.acceptance = checkAcceptance(best_breakdown);
    result.warnings = monitor.warnings();
    if (result.failed_evaluations > 0) {
        result.warnings.push_back(std::to_string(result.failed_evaluations) + " of " +
                                  std::to_string(result.evaluations) +
                                  " evaluations failed and were excluded from the swarm");
    }

    auto end = std::chrono::high_resolution_clock::now();
    result.time_taken = std::chrono::duration<double>(end - start).count();
    return result;
}
