// src/core/TunerConfig.cpp
//
// Controller registry, name parsing and configuration validation for the
// **ChatteringOptimizationEngine**.
#include "TunerConfig.hpp"
#include <cmath>
#include <stdexcept>

std::string toString(ControllerType type) {
    switch (type) {
        case ControllerType::Classical: return "classical_smc";
        case ControllerType::Adaptive: return "adaptive_smc";
        case ControllerType::SuperTwisting: return "sta_smc";
        case ControllerType::Hybrid: return "hybrid_adaptive_sta_smc";
    }
    return "unknown";
}

ControllerType parseControllerType(const std::string& name) {
    if (name == "classical_smc" || name == "classical") return ControllerType::Classical;
    if (name == "adaptive_smc" || name == "adaptive") return ControllerType::Adaptive;
    if (name == "sta_smc" || name == "sta") return ControllerType::SuperTwisting;
    if (name == "hybrid_adaptive_sta_smc" || name == "hybrid") return ControllerType::Hybrid;
    throw std::invalid_argument("Unknown controller type: " + name);
}

/**
 * @brief Builds the search bounds of a controller variant.
 *
 * Gain layouts:
 *   classical  [k1, k2, λ1, λ2, K, kd]      (6)
 *   adaptive   [k1, k2, λ1, λ2, γ]          (5)
 *   STA        [K1, K2, k1, k2, λ1, λ2]     (6)
 *   hybrid     [c1, λ1, c2, λ2]             (4)
 */
ControllerProfile makeControllerProfile(ControllerType type, BoundsProfile profile) {
    ControllerProfile out;
    out.type = type;
    switch (type) {
        case ControllerType::Classical:
            out.lower = {1.0, 1.0, 1.0, 1.0, 5.0, 0.1};
            out.upper = {30.0, 30.0, 20.0, 20.0, 50.0, 10.0};
            break;
        case ControllerType::Adaptive:
            out.lower = {2.0, 2.0, 1.0, 1.0, 0.5};
            out.upper = {40.0, 40.0, 25.0, 25.0, 10.0};
            break;
        case ControllerType::SuperTwisting:
            out.lower = {3.0, 2.0, 2.0, 2.0, 0.5, 0.5};
            out.upper = {50.0, 30.0, 30.0, 30.0, 20.0, 20.0};
            break;
        case ControllerType::Hybrid:
            out.lower = {2.0, 2.0, 1.0, 1.0};
            out.upper = {30.0, 30.0, 20.0, 20.0};
            break;
    }
    if (profile == BoundsProfile::Aggressive) {
        for (auto& lo : out.lower) lo *= 0.5;
        for (auto& up : out.upper) up *= 1.5;
    } else if (profile == BoundsProfile::Conservative) {
        for (size_t i = 0; i < out.lower.size(); ++i) {
            const double center = 0.5 * (out.lower[i] + out.upper[i]);
            const double half_width = 0.3 * (out.upper[i] - out.lower[i]);
            out.lower[i] = center - half_width;
            out.upper[i] = center + half_width;
        }
    }
    return out;
}

void validate(const FitnessConfig& cfg) {
    if (!std::isfinite(cfg.tracking_threshold) || cfg.tracking_threshold < 0.0) {
        throw std::invalid_argument("FitnessConfig: tracking_threshold must be finite and >= 0");
    }
    if (!std::isfinite(cfg.penalty_scale) || cfg.penalty_scale <= 0.0) {
        throw std::invalid_argument("FitnessConfig: penalty_scale must be finite and > 0");
    }
    if (!(cfg.divergence_bound > 0.0)) {
        throw std::invalid_argument("FitnessConfig: divergence_bound must be > 0");
    }
}

void validate(const ControllerProfile& profile) {
    if (profile.lower.size() != profile.upper.size()) {
        throw std::invalid_argument("ControllerProfile: lower and upper bounds differ in size");
    }
    if (profile.gainCount() < 4 || profile.gainCount() > 6) {
        throw std::invalid_argument("ControllerProfile: " + toString(profile.type) +
                                    " must have 4-6 gains, got " +
                                    std::to_string(profile.gainCount()));
    }
    for (size_t i = 0; i < profile.lower.size(); ++i) {
        if (!std::isfinite(profile.lower[i]) || !std::isfinite(profile.upper[i]) ||
            profile.lower[i] >= profile.upper[i]) {
            throw std::invalid_argument("ControllerProfile: invalid bound interval for gain " +
                                        std::to_string(i));
        }
    }
}

void validate(const SwarmConfig& cfg) {
    if (cfg.n_particles == 0) throw std::invalid_argument("SwarmConfig: n_particles must be > 0");
    if (cfg.iterations == 0) throw std::invalid_argument("SwarmConfig: iterations must be > 0");
    if (cfg.w < 0.0 || cfg.c1 < 0.0 || cfg.c2 < 0.0 || cfg.w_end < 0.0) {
        throw std::invalid_argument("SwarmConfig: PSO weights must be non-negative");
    }
    if (cfg.velocity_clamp < 0.0) {
        throw std::invalid_argument("SwarmConfig: velocity_clamp must be non-negative");
    }
    if (!std::isfinite(cfg.failure_fitness)) {
        throw std::invalid_argument("SwarmConfig: failure_fitness must be finite");
    }
}
