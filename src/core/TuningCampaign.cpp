// src/core/TuningCampaign.cpp
//
// Runs independent per-controller optimisations and persists their results.
#include "TuningCampaign.hpp"
#include "ResultWriter.hpp"
#include "ThreadPool.hpp"
#include <exception>
#include <future>
#include <iostream>
#include <stdexcept>

TuningCampaign::TuningCampaign(FitnessConfig fitness_cfg, SwarmConfig swarm_cfg,
                               SimulationFactory factory, std::string mode, std::string measure,
                               BoundsProfile bounds)
    : fitness_cfg_(fitness_cfg), swarm_cfg_(swarm_cfg), factory_(std::move(factory)),
      mode_(std::move(mode)), measure_(std::move(measure)), bounds_(bounds) {
    validate(fitness_cfg_);
    validate(swarm_cfg_);
    if (!factory_) throw std::invalid_argument("TuningCampaign: simulation factory must be callable");
    // Fail on unknown names now rather than inside a worker.
    createChatteringMeasure(measure_);
    createEvaluationStrategy(mode_);
}

OptimizationResult TuningCampaign::runOne(ControllerType type) const {
    ChatteringFitnessEvaluator evaluator(fitness_cfg_, factory_(type), createChatteringMeasure(measure_));
    SwarmOptimizer optimizer(makeControllerProfile(type, bounds_), swarm_cfg_,
                             createEvaluationStrategy(mode_));
    OptimizationResult result = optimizer.run(evaluator);
    if (swarm_cfg_.verbose) {
        std::cout << "[TuningCampaign] " << toString(type) << ": best fitness " << result.best_fitness
                  << ", chattering " << result.best_breakdown.chattering_index
                  << ", tracking RMS " << result.best_breakdown.tracking_rms
                  << ", criteria " << result.acceptance.passed() << "/3, "
                  << result.time_taken << " s" << std::endl;
    }
    return result;
}

std::vector<OptimizationResult> TuningCampaign::run(const std::vector<ControllerType>& controllers,
                                                    bool parallel) const {
    std::vector<OptimizationResult> results;
    results.reserve(controllers.size());
    if (!parallel || controllers.size() < 2) {
        for (ControllerType type : controllers) results.push_back(runOne(type));
        return results;
    }

    ThreadPool pool(controllers.size());
    std::vector<std::future<OptimizationResult>> futures;
    futures.reserve(controllers.size());
    for (ControllerType type : controllers) {
        futures.push_back(pool.enqueue([this, type]() { return runOne(type); }));
    }
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            results.push_back(f.get());
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
    return results;
}

std::vector<OptimizationResult> TuningCampaign::runAndSave(const std::vector<ControllerType>& controllers,
                                                           const std::filesystem::path& output_dir,
                                                           bool parallel) const {
    std::vector<OptimizationResult> results = run(controllers, parallel);
    for (const auto& result : results) {
        const std::filesystem::path path = resultPathFor(output_dir, result.controller);
        saveResult(path, result);
        if (swarm_cfg_.verbose) std::cout << "[TuningCampaign] saved " << path.string() << std::endl;
    }
    saveSummary(output_dir / "optimization_summary.json", results, swarm_cfg_);
    return results;
}
