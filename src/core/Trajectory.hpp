// src/core/Trajectory.hpp
//
// Header defining the **Trajectory** record exchanged between the closed-loop
// simulation collaborator and the fitness evaluator of the
// **ChatteringOptimizationEngine**.
//
// A trajectory is a uniformly sampled record of one simulation run:
//   • `control[k]`      – control input u(t_k) applied at sample k
//   • `state_error[k]`  – tracked-state errors e(t_k) (e.g. both pendulum angles)
//   • `dt`              – sample period in seconds
//
// The evaluator only reads trajectories; the simulation owns their production.
// Scalar reductions used by the fitness pipeline (RMS tracking error, control
// effort, total variation) live here so that every measure sees the same
// definitions.
#ifndef TRAJECTORY_HPP
#define TRAJECTORY_HPP
#include <vector>

/// Ordered controller gains (4-6 entries depending on the controller type).
using GainVector = std::vector<double>;

/**
 * @brief Sampled output of a single closed-loop simulation run.
 */
struct Trajectory {
    double dt = 0.01;                              ///< Sample period [s].
    std::vector<double> control;                   ///< Control input per sample.
    std::vector<std::vector<double>> state_error;  ///< Tracked-state errors per sample.
};

/**
 * @brief True when every control and state-error sample is finite.
 */
bool isFinite(const Trajectory& traj);

/**
 * @brief Largest absolute tracked-state error over the horizon.
 */
double maxAbsStateError(const Trajectory& traj);

/**
 * @brief Root-mean-square tracking error over all tracked states and samples.
 *
 * @return double sqrt(mean(e_ij^2)), 0.0 when there are no samples.
 */
double computeTrackingRMS(const Trajectory& traj);

/**
 * @brief Root-mean-square control effort sqrt(mean(u_k^2)).
 */
double computeControlEffortRMS(const Trajectory& traj);

/**
 * @brief Total variation sum |u_{k+1} - u_k| of the control series.
 */
double computeTotalVariation(const Trajectory& traj);

#endif // TRAJECTORY_HPP
