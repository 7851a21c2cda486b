// src/core/FitnessMonitor.hpp
//
// Runtime detector for fitness collapse in the **ChatteringOptimizationEngine**.
//
// Two signatures are watched during an optimisation run:
// • within an iteration, a large share of candidates receiving the identical
//   fitness value (the objective has no slope there);
// • across the run, a cost history that never changes (e.g. 0.0 from the
//   first iteration to the last).
//
// Both are warnings, not errors: the run still completes, but its result must
// be inspected before it is trusted.
#ifndef FITNESS_MONITOR_HPP
#define FITNESS_MONITOR_HPP
#include <cstddef>
#include <string>
#include <vector>

class FitnessMonitor {
public:
    /**
     * @param flat_fraction Share of candidates with one identical fitness that
     *        triggers a warning (0 < flat_fraction <= 1).
     * @param min_candidates Iterations with fewer successful candidates are
     *        not judged.
     * @param verbose Echo each warning on std::cerr when raised.
     */
    explicit FitnessMonitor(double flat_fraction = 0.5, size_t min_candidates = 4,
                            bool verbose = false);

    /**
     * @brief Inspects the successful fitness values of one iteration.
     *
     * @return bool True when the iteration was flagged as flat.
     */
    bool recordIteration(size_t iteration, const std::vector<double>& fitness_values);

    /// Appends the best fitness of an iteration to the cost history.
    void recordBest(double best_fitness);

    /**
     * @brief Closes the run; flags a constant cost history.
     */
    void finish();

    size_t flatIterations() const { return flat_iterations_; }
    bool historyFlat() const { return history_flat_; }
    const std::vector<double>& history() const { return history_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    double flat_fraction_;
    size_t min_candidates_;
    bool verbose_;
    size_t flat_iterations_ = 0;
    bool history_flat_ = false;
    std::vector<double> history_;
    std::vector<std::string> warnings_;

    void warn(const std::string& message);
};

#endif // FITNESS_MONITOR_HPP
