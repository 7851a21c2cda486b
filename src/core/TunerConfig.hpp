// src/core/TunerConfig.hpp
//
// Explicit, immutable configuration values for the
// **ChatteringOptimizationEngine**.
//
// Every tunable is a plain aggregate passed by value at construction time;
// nothing is read from ambient or global state. Concurrent tuning runs for
// different controller types therefore never interfere.
//
// • FitnessConfig      – tracking constraint and divergence limits
// • ControllerProfile  – gain arity and per-gain PSO search bounds
// • SwarmConfig        – PSO hyper-parameters of the driver
// • AcceptanceCriteria – post-optimisation validation thresholds
#ifndef TUNER_CONFIG_HPP
#define TUNER_CONFIG_HPP
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Parameters of the chattering-constrained objective.
 */
struct FitnessConfig {
    double tracking_threshold = 0.1;   ///< Feasible tracking RMS [rad].
    double penalty_scale = 1000.0;     ///< Penalty per unit of constraint violation.
    double divergence_bound = 1e3;     ///< |state error| above this is divergence.
};

/// Sliding-mode controller variants that share the fitness logic.
enum class ControllerType { Classical, Adaptive, SuperTwisting, Hybrid };

/// Bound presets around the base search box.
enum class BoundsProfile { Aggressive, Balanced, Conservative };

/**
 * @brief Gain arity and PSO search bounds of one controller variant.
 */
struct ControllerProfile {
    ControllerType type = ControllerType::Classical;
    std::vector<double> lower;
    std::vector<double> upper;

    size_t gainCount() const { return lower.size(); }
};

/**
 * @brief Global-best PSO hyper-parameters.
 *
 * Defaults follow the documented tuning runs (30 particles, 150 iterations,
 * w = 0.7, c1 = c2 = 2.0).
 */
struct SwarmConfig {
    size_t n_particles = 30;
    size_t iterations = 150;
    double w = 0.7;               ///< Inertia weight (start value when scheduled).
    double c1 = 2.0;              ///< Cognitive weight.
    double c2 = 2.0;              ///< Social weight.
    bool use_w_schedule = false;  ///< Linear inertia decay from w to w_end.
    double w_end = 0.4;
    double velocity_clamp = 0.0;  ///< Max |v_i| as fraction of bound width; 0 disables.
    unsigned int seed = 42;
    double failure_fitness = 1e6; ///< Reported cost while no evaluation has succeeded.
    double tolerance = 0.0;       ///< Minimum best-fitness improvement for early stop.
    size_t patience = 0;          ///< Stagnant iterations before stopping; 0 disables.
    bool verbose = false;         ///< Progress on std::cout, warnings on std::cerr.
};

/**
 * @brief Validation thresholds applied to the best candidate.
 */
struct AcceptanceCriteria {
    double max_chattering_index = 2.0;
    double max_tracking_rms = 0.1;
    double min_smoothness_index = 0.7;
};

/**
 * @brief Canonical name ("classical_smc", "adaptive_smc", "sta_smc",
 * "hybrid_adaptive_sta_smc").
 */
std::string toString(ControllerType type);

/**
 * @brief Parses canonical or short ("classical", "adaptive", "sta", "hybrid")
 * controller names.
 *
 * @throws std::invalid_argument for unknown names.
 */
ControllerType parseControllerType(const std::string& name);

/**
 * @brief Builds the search bounds of a controller variant.
 *
 * Base boxes come from the controller factory. Aggressive widens them
 * (0.5 x lower, 1.5 x upper); Conservative keeps the central 60 % of each
 * interval.
 */
ControllerProfile makeControllerProfile(ControllerType type,
                                        BoundsProfile profile = BoundsProfile::Balanced);

/// @throws std::invalid_argument when the configuration is unusable.
void validate(const FitnessConfig& cfg);
/// @throws std::invalid_argument when the configuration is unusable.
void validate(const ControllerProfile& profile);
/// @throws std::invalid_argument when the configuration is unusable.
void validate(const SwarmConfig& cfg);

#endif // TUNER_CONFIG_HPP
