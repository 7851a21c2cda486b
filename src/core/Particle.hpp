// src/core/Particle.hpp
//
// Header defining the **Particle** class of the **ChatteringOptimizationEngine**
// swarm optimizer. Each particle is one candidate gain vector moving through
// the controller's bounded search box:
//
// \[
// v_{k+1} = w v_k + c_1 r_1 (p - x_k) + c_2 r_2 (g - x_k), \qquad
// x_{k+1} = \Pi_{[l,u]}(x_k + v_{k+1})
// \]
//
// - \( p \): the particle's personal best position
// - \( g \): the swarm's global best position
// - \( \Pi_{[l,u]} \): projection onto the gain bounds
//
// Particles are owned and updated by the optimizer thread only; fitness
// evaluation works on copies of their positions.
#ifndef PARTICLE_HPP
#define PARTICLE_HPP
#include <limits>
#include <random>
#include "Trajectory.hpp"

/**
 * @brief PSO coefficients of one velocity update.
 */
struct VelocityWeights {
    double w = 0.7;
    double c1 = 2.0;
    double c2 = 2.0;
};

/**
 * @class Particle
 * @brief Position, velocity and personal best of one swarm member.
 */
class Particle {
public:
    GainVector position;
    GainVector velocity;
    GainVector best_position;
    double best_fitness = std::numeric_limits<double>::infinity();

    /**
     * @brief Constructs a particle at a position with an initial velocity.
     *
     * The personal best starts at the initial position with infinite fitness.
     */
    Particle(GainVector pos, GainVector vel);

    /**
     * @brief Records a fitness for the current position.
     *
     * @return bool True when it improved the personal best.
     */
    bool recordFitness(double fitness);

    /**
     * @brief Applies the PSO velocity update towards the personal and global best.
     *
     * @param global_best Swarm best position.
     * @param weights Inertia / cognitive / social coefficients.
     * @param max_speed Per-gain velocity limit; empty to disable clamping.
     * @param gen Random engine providing r1, r2 ~ U(0, 1) per component.
     */
    void updateVelocity(const GainVector& global_best, const VelocityWeights& weights,
                        const std::vector<double>& max_speed, std::mt19937& gen);

    /**
     * @brief Moves by the current velocity and projects onto the bounds.
     *
     * Components that hit a bound have their velocity zeroed.
     */
    void move(const std::vector<double>& lower, const std::vector<double>& upper);
};

#endif // PARTICLE_HPP
