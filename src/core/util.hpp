// src/core/util.hpp
//
// Utility header for the **ChatteringOptimizationEngine** framework.
// Provides numeric reductions shared by the chattering measures and the
// trajectory metrics, plus swarm initialisation for the PSO driver.
//
// All utilities are thread-safe when used with const inputs; random helpers
// take the generator by reference so callers control seeding.
#ifndef UTIL_HPP
#define UTIL_HPP
#include <random>
#include <vector>
#include "Trajectory.hpp"

/**
 * @brief Computes sqrt(mean(v_i^2)).
 *
 * @param values Samples to reduce.
 * @return double RMS value, 0.0 for an empty input.
 */
double computeRMS(const std::vector<double>& values);

/**
 * @brief Generates n gain vectors uniformly distributed inside [lower, upper].
 *
 * @param lower Per-gain lower bounds.
 * @param upper Per-gain upper bounds (same size as lower).
 * @param n Number of vectors to generate.
 * @param gen Random engine (seeded by the caller for reproducibility).
 */
std::vector<GainVector> generateSwarm(const std::vector<double>& lower,
                                      const std::vector<double>& upper,
                                      size_t n, std::mt19937& gen);

#endif // UTIL_HPP
