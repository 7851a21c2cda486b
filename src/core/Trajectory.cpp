// src/core/Trajectory.cpp
//
// Scalar reductions over a sampled closed-loop trajectory. These are the
// building blocks of the fitness breakdown: the tracking RMS feeds the
// constraint penalty, the effort and total variation are diagnostics reported
// alongside the fitness.
#include "Trajectory.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

bool isFinite(const Trajectory& traj) {
    for (double u : traj.control) {
        if (!std::isfinite(u)) return false;
    }
    for (const auto& sample : traj.state_error) {
        for (double e : sample) {
            if (!std::isfinite(e)) return false;
        }
    }
    return true;
}

double maxAbsStateError(const Trajectory& traj) {
    double peak = 0.0;
    for (const auto& sample : traj.state_error) {
        for (double e : sample) {
            peak = std::max(peak, std::abs(e));
        }
    }
    return peak;
}

/**
 * @brief RMS over every tracked state of every sample.
 *
 * Equivalent to flattening the (samples x states) matrix and taking
 * sqrt(mean(e^2)), so two tracked angles contribute with equal weight.
 */
double computeTrackingRMS(const Trajectory& traj) {
    double sum_sq = 0.0;
    size_t count = 0;
    for (const auto& sample : traj.state_error) {
        for (double e : sample) {
            sum_sq += e * e;
        }
        count += sample.size();
    }
    return count > 0 ? std::sqrt(sum_sq / static_cast<double>(count)) : 0.0;
}

double computeControlEffortRMS(const Trajectory& traj) {
    return computeRMS(traj.control);
}

double computeTotalVariation(const Trajectory& traj) {
    double tv = 0.0;
    for (size_t k = 1; k < traj.control.size(); ++k) {
        tv += std::abs(traj.control[k] - traj.control[k - 1]);
    }
    return tv;
}
