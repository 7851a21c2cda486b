// src/core/FitnessMonitor.cpp
//
// Flat-fitness detection for the swarm optimizer.
#include "FitnessMonitor.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

FitnessMonitor::FitnessMonitor(double flat_fraction, size_t min_candidates, bool verbose)
    : flat_fraction_(flat_fraction), min_candidates_(min_candidates), verbose_(verbose) {
    if (!(flat_fraction > 0.0 && flat_fraction <= 1.0)) {
        throw std::invalid_argument("FitnessMonitor: flat_fraction must be in (0, 1]");
    }
    if (min_candidates_ < 2) min_candidates_ = 2;
}

/**
 * @brief Finds the most frequent exact fitness value of the iteration.
 *
 * Values are sorted and scanned for the longest run of equal entries, O(n log n).
 * Exact equality is intended: a collapsed objective returns bit-identical
 * values, while a working one virtually never does for distinct candidates.
 */
bool FitnessMonitor::recordIteration(size_t iteration, const std::vector<double>& fitness_values) {
    if (fitness_values.size() < min_candidates_) return false;
    std::vector<double> sorted(fitness_values);
    std::sort(sorted.begin(), sorted.end());
    size_t longest = 1, run = 1;
    double modal = sorted.front();
    for (size_t i = 1; i < sorted.size(); ++i) {
        run = (sorted[i] == sorted[i - 1]) ? run + 1 : 1;
        if (run > longest) {
            longest = run;
            modal = sorted[i];
        }
    }
    const double share = static_cast<double>(longest) / static_cast<double>(sorted.size());
    if (longest < 2 || share < flat_fraction_) return false;

    ++flat_iterations_;
    std::ostringstream msg;
    msg << "iteration " << iteration << ": fitness " << modal << " identical across "
        << longest << "/" << sorted.size() << " candidates";
    warn(msg.str());
    return true;
}

void FitnessMonitor::recordBest(double best_fitness) {
    history_.push_back(best_fitness);
}

void FitnessMonitor::finish() {
    if (history_.size() < 2) return;
    const auto range = std::minmax_element(history_.begin(), history_.end());
    if (*range.first != *range.second) return;
    history_flat_ = true;
    std::ostringstream msg;
    msg << "cost history constant at " << history_.front() << " for all "
        << history_.size() << " iterations; result needs manual investigation";
    warn(msg.str());
}

void FitnessMonitor::warn(const std::string& message) {
    warnings_.push_back(message);
    if (verbose_) std::cerr << "[FitnessMonitor] WARNING: " << message << std::endl;
}
