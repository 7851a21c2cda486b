// src/core/TuningCampaign.hpp
//
// Multi-controller tuning campaign of the **ChatteringOptimizationEngine**.
//
// A campaign optimises several controller variants (classical, adaptive, STA,
// hybrid) with the same objective settings. Each variant gets its own
// simulation instance, evaluator, evaluation strategy and optimizer, so runs
// share no mutable state and may execute concurrently on a ThreadPool.
#ifndef TUNING_CAMPAIGN_HPP
#define TUNING_CAMPAIGN_HPP
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "Engine.hpp"

/// Builds an isolated simulation collaborator for one controller variant.
using SimulationFactory = std::function<SimulationFn(ControllerType)>;

class TuningCampaign {
public:
    /**
     * @param fitness_cfg Objective settings shared by every run.
     * @param swarm_cfg PSO settings shared by every run.
     * @param factory Simulation factory, called once per run.
     * @param mode Evaluation mode for createEvaluationStrategy().
     * @param measure Chattering measure name for createChatteringMeasure().
     * @param bounds Bound preset for makeControllerProfile().
     */
    TuningCampaign(FitnessConfig fitness_cfg, SwarmConfig swarm_cfg, SimulationFactory factory,
                   std::string mode = "sequential", std::string measure = "derivative_rms",
                   BoundsProfile bounds = BoundsProfile::Balanced);

    /**
     * @brief Optimises every controller; results are returned in input order.
     *
     * @param parallel Run the controllers concurrently on a ThreadPool.
     * @throws the first error raised by any run, after all runs finished.
     */
    std::vector<OptimizationResult> run(const std::vector<ControllerType>& controllers,
                                        bool parallel = false) const;

    /**
     * @brief run() followed by one result file per controller and a summary.
     *
     * Files: resultPathFor(output_dir, type) and
     * output_dir / "optimization_summary.json".
     */
    std::vector<OptimizationResult> runAndSave(const std::vector<ControllerType>& controllers,
                                               const std::filesystem::path& output_dir,
                                               bool parallel = false) const;

private:
    FitnessConfig fitness_cfg_;
    SwarmConfig swarm_cfg_;
    SimulationFactory factory_;
    std::string mode_;
    std::string measure_;
    BoundsProfile bounds_;

    OptimizationResult runOne(ControllerType type) const;
};

#endif // TUNING_CAMPAIGN_HPP
