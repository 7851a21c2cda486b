// src/core/util.cpp
//
// Implementation of utility functions for the **ChatteringOptimizationEngine**
// core library.
//
// This file provides:
// • RMS reduction shared by the tracking metric and the derivative chattering
//   measure.
// • Uniform swarm initialisation inside per-gain bounds.
//
// Random generation never seeds itself: the swarm optimizer owns a single
// std::mt19937 seeded from SwarmConfig::seed so that runs are reproducible.
#include "util.hpp"
#include <cmath>
#include <stdexcept>

/**
 * @brief Computes sqrt(mean(v_i^2)).
 *
 * Accumulates in double precision; an empty input yields 0.0 so that callers
 * decide themselves whether emptiness is an error.
 */
double computeRMS(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += v * v;
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

/**
 * @brief Generates n gain vectors uniformly distributed inside [lower, upper].
 *
 * Each component i is drawn from U(lower_i, upper_i). Pre-allocates the result
 * with reserve() to avoid reallocations for large swarms.
 */
std::vector<GainVector> generateSwarm(const std::vector<double>& lower,
                                      const std::vector<double>& upper,
                                      size_t n, std::mt19937& gen) {
    if (lower.size() != upper.size()) {
        throw std::invalid_argument("generateSwarm: lower and upper bounds differ in size");
    }
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::vector<GainVector> swarm;
    swarm.reserve(n);
    for (size_t p = 0; p < n; ++p) {
        GainVector gains(lower.size());
        for (size_t i = 0; i < lower.size(); ++i) {
            gains[i] = lower[i] + unit(gen) * (upper[i] - lower[i]);
        }
        swarm.push_back(std::move(gains));
    }
    return swarm;
}
