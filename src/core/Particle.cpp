// src/core/Particle.cpp
//
// Implementation of the **Particle** class for the swarm optimizer of the
// **ChatteringOptimizationEngine**.
//
// The update uses the classic global-best PSO rule; random factors r1 and r2
// are drawn independently per component from the optimizer's generator, so a
// fixed seed reproduces the whole trajectory of the swarm.
#include "Particle.hpp"
#include <algorithm>

Particle::Particle(GainVector pos, GainVector vel)
    : position(std::move(pos)), velocity(std::move(vel)), best_position(position) {}

bool Particle::recordFitness(double fitness) {
    if (fitness < best_fitness) {
        best_fitness = fitness;
        best_position = position;
        return true;
    }
    return false;
}

/**
 * @brief Applies the PSO velocity update.
 *
 * \( v_i \leftarrow w v_i + c_1 r_1 (p_i - x_i) + c_2 r_2 (g_i - x_i) \),
 * then clamps \( |v_i| \le v^{max}_i \) when limits are supplied.
 */
void Particle::updateVelocity(const GainVector& global_best, const VelocityWeights& weights,
                              const std::vector<double>& max_speed, std::mt19937& gen) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (size_t i = 0; i < position.size(); ++i) {
        const double r1 = unit(gen);
        const double r2 = unit(gen);
        double v = weights.w * velocity[i]
                 + weights.c1 * r1 * (best_position[i] - position[i])
                 + weights.c2 * r2 * (global_best[i] - position[i]);
        if (!max_speed.empty()) {
            v = std::min(std::max(v, -max_speed[i]), max_speed[i]);
        }
        velocity[i] = v;
    }
}

void Particle::move(const std::vector<double>& lower, const std::vector<double>& upper) {
    for (size_t i = 0; i < position.size(); ++i) {
        double x = position[i] + velocity[i];
        if (x < lower[i]) {
            x = lower[i];
            velocity[i] = 0.0;
        } else if (x > upper[i]) {
            x = upper[i];
            velocity[i] = 0.0;
        }
        position[i] = x;
    }
}
