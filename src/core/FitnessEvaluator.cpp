// src/core/FitnessEvaluator.cpp
//
// Implements the chattering-constrained objective of the
// **ChatteringOptimizationEngine**.
//
// Evaluation pipeline for one candidate:
//   1. simulate(gains)                  – external collaborator
//   2. shape / finiteness / bound checks – divergence and emptiness are errors
//   3. chattering_index = measure(u, dt)
//   4. tracking_rms     = RMS(e)
//   5. fitness          = chattering_index + penalty(tracking_rms)
#include "FitnessEvaluator.hpp"
#include <cmath>
#include <string>

double computeConstraintPenalty(double tracking_rms, const FitnessConfig& cfg) {
    if (tracking_rms <= cfg.tracking_threshold) return 0.0;
    return (tracking_rms - cfg.tracking_threshold) * cfg.penalty_scale;
}

double combineFitness(double chattering_index, double tracking_rms, const FitnessConfig& cfg) {
    return chattering_index + computeConstraintPenalty(tracking_rms, cfg);
}

AcceptanceReport checkAcceptance(const FitnessBreakdown& breakdown,
                                 const AcceptanceCriteria& criteria) {
    AcceptanceReport report;
    report.chattering = breakdown.chattering_index < criteria.max_chattering_index;
    report.tracking = breakdown.tracking_rms < criteria.max_tracking_rms;
    report.smoothness = breakdown.smoothness_index > criteria.min_smoothness_index;
    return report;
}

ChatteringFitnessEvaluator::ChatteringFitnessEvaluator(FitnessConfig cfg, SimulationFn simulate,
                                                       std::shared_ptr<const ChatteringMeasure> measure)
    : cfg_(cfg), simulate_(std::move(simulate)), measure_(std::move(measure)) {
    validate(cfg_);
    if (!simulate_) {
        throw std::invalid_argument("ChatteringFitnessEvaluator: simulate must be callable");
    }
    if (!measure_) measure_ = std::make_shared<DerivativeRMSMeasure>();
}

/**
 * @brief Runs the simulation and reduces its trajectory.
 *
 * Any std::exception escaping the collaborator is re-raised as
 * SimulationDivergenceError carrying the original message; no retry and no
 * substitute fitness.
 */
FitnessBreakdown ChatteringFitnessEvaluator::evaluate(const GainVector& gains) const {
    Trajectory traj;
    try {
        traj = simulate_(gains);
    } catch (const SimulationDivergenceError&) {
        throw;
    } catch (const EmptyTrajectoryError&) {
        throw;
    } catch (const std::exception& e) {
        throw SimulationDivergenceError(e.what());
    }
    return evaluateTrajectory(traj);
}

FitnessBreakdown ChatteringFitnessEvaluator::evaluateTrajectory(const Trajectory& traj) const {
    if (traj.control.empty()) {
        throw EmptyTrajectoryError("control series has no samples");
    }
    if (traj.state_error.empty()) {
        throw EmptyTrajectoryError("state-error series has no samples");
    }
    for (const auto& sample : traj.state_error) {
        if (sample.empty()) throw EmptyTrajectoryError("state-error sample has no tracked states");
    }
    if (!std::isfinite(traj.dt) || traj.dt <= 0.0) {
        throw std::invalid_argument("Trajectory: dt must be finite and > 0, got " +
                                    std::to_string(traj.dt));
    }
    if (!isFinite(traj)) {
        throw SimulationDivergenceError("non-finite control or state sample");
    }
    const double peak = maxAbsStateError(traj);
    if (peak > cfg_.divergence_bound) {
        throw SimulationDivergenceError("state error " + std::to_string(peak) +
                                        " exceeds bound " + std::to_string(cfg_.divergence_bound));
    }

    FitnessBreakdown out;
    out.chattering_index = measure_->compute(traj.control, traj.dt);
    if (!std::isfinite(out.chattering_index)) {
        throw SimulationDivergenceError("chattering index overflow");
    }
    out.tracking_rms = computeTrackingRMS(traj);
    out.penalty = computeConstraintPenalty(out.tracking_rms, cfg_);
    out.fitness = combineFitness(out.chattering_index, out.tracking_rms, cfg_);
    out.control_effort_rms = computeControlEffortRMS(traj);
    out.total_variation = computeTotalVariation(traj);
    out.smoothness_index = 1.0 / (1.0 + out.total_variation);
    return out;
}
