// src/core/test_optimizer.cpp
//
// CTest suite for the swarm optimizer and its evaluation back-ends.
//
// A synthetic closed loop stands in for the pendulum simulation: gain 0 sets
// the tracking error (0.2 / g0 rad, feasible for g0 >= 2) and gain 1 sets the
// switching amplitude of the control (derivative RMS 0.2 * g1). The optimum is
// therefore the low-chattering corner g1 -> lower bound inside the feasible
// region. Tests check convergence there, identical results for the
// sequential, thread-pool and OpenMP back-ends, failure accounting, early
// stopping and flat-fitness warnings.

#include "Engine.hpp"
#include "FitnessMonitor.hpp"
#include "Particle.hpp"
#include <cmath>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void check(bool condition, const std::string& name) {
    if (!condition) {
        std::cerr << "Test failed: " << name << std::endl;
        std::exit(1);
    }
    std::cout << "Test passed: " << name << std::endl;
}

Trajectory syntheticLoop(const GainVector& g) {
    Trajectory traj;
    traj.dt = 0.01;
    const double amplitude = 0.001 * g[1];
    const double error = 0.2 / g[0];
    for (size_t k = 0; k < 200; ++k) {
        traj.control.push_back(2.0 + (k % 2 == 0 ? amplitude : -amplitude));
        traj.state_error.push_back({error, -error});
    }
    return traj;
}

SwarmConfig testSwarm() {
    SwarmConfig cfg;
    cfg.n_particles = 30;
    cfg.iterations = 60;
    cfg.w = 0.7;
    cfg.c1 = 1.5;
    cfg.c2 = 1.5;
    cfg.velocity_clamp = 0.2;
    cfg.seed = 42;
    return cfg;
}

bool contains(const std::vector<std::string>& warnings, const std::string& needle) {
    for (const auto& w : warnings) {
        if (w.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

void test_converges_to_low_chattering() {
    ChatteringFitnessEvaluator evaluator(FitnessConfig{}, syntheticLoop);
    SwarmOptimizer optimizer(makeControllerProfile(ControllerType::Classical), testSwarm());
    const OptimizationResult result = optimizer.run(evaluator);

    check(result.best_gains.size() == 6, "best gains have the classical arity");
    check(result.best_breakdown.penalty == 0.0, "best candidate satisfies the tracking constraint");
    check(result.best_breakdown.tracking_rms <= 0.1, "best tracking RMS within threshold");
    check(result.best_breakdown.chattering_index < 0.5, "best chattering index near the minimum 0.2");
    check(result.best_gains[1] < 2.5, "switching gain driven towards its lower bound");
    check(result.best_fitness == result.best_breakdown.fitness, "best fitness matches its breakdown");
    check(result.cost_history.size() == 61, "cost history covers the initial swarm and 60 iterations");
    check(result.iterations == 60 && result.evaluations == 30 * 61, "evaluation count");
    check(result.failed_evaluations == 0, "no failed evaluations");
    for (size_t i = 1; i < result.cost_history.size(); ++i) {
        if (result.cost_history[i] > result.cost_history[i - 1]) check(false, "cost history is non-increasing");
    }
    check(result.cost_history.back() < result.cost_history.front(), "optimizer improves on the initial swarm");
    check(!contains(result.warnings, "cost history constant"), "sloped objective has a moving cost history");
    check(result.acceptance.chattering && result.acceptance.tracking, "acceptance: chattering and tracking");
    check(result.strategy == "sequential", "default back-end is sequential");
}

void test_backends_agree() {
    ChatteringFitnessEvaluator evaluator(FitnessConfig{}, syntheticLoop);
    const ControllerProfile profile = makeControllerProfile(ControllerType::SuperTwisting);
    SwarmConfig cfg = testSwarm();
    cfg.iterations = 25;
    cfg.use_w_schedule = true;

    SwarmOptimizer sequential(profile, cfg, createEvaluationStrategy("sequential"));
    SwarmOptimizer pooled(profile, cfg, std::make_unique<ThreadPoolEvaluationStrategy>(4));
    SwarmOptimizer openmp(profile, cfg, createEvaluationStrategy("openmp"));
    const OptimizationResult a = sequential.run(evaluator);
    const OptimizationResult b = pooled.run(evaluator);
    const OptimizationResult c = openmp.run(evaluator);

    check(b.strategy == "threadpool" && c.strategy == "openmp", "back-end names");
    check(a.best_gains == b.best_gains && a.best_gains == c.best_gains, "identical best gains across back-ends");
    check(a.cost_history == b.cost_history && a.cost_history == c.cost_history,
          "identical cost history across back-ends");

    // A pool is reused across runs.
    const OptimizationResult again = pooled.run(evaluator);
    check(again.best_gains == b.best_gains, "thread pool back-end is reusable");
}

void test_failed_evaluations_are_counted() {
    ChatteringFitnessEvaluator evaluator(FitnessConfig{}, [](const GainVector& g) {
        if (g[0] < 8.0) throw SimulationDivergenceError("pendulum fell over");
        Trajectory traj = syntheticLoop(g);
        if (g[2] > 18.0) traj.state_error[10][0] = std::nan("");
        return traj;
    });
    SwarmConfig cfg = testSwarm();
    cfg.iterations = 20;
    SwarmOptimizer optimizer(makeControllerProfile(ControllerType::Classical), cfg,
                             createEvaluationStrategy("threadpool"));
    const OptimizationResult result = optimizer.run(evaluator);

    check(result.failed_evaluations > 0, "failed evaluations are counted");
    check(result.failed_evaluations < result.evaluations, "some evaluations succeeded");
    check(result.best_gains[0] >= 8.0 && result.best_gains[2] <= 18.0, "best gains come from a successful run");
    check(result.best_fitness < cfg.failure_fitness, "failure score never reported as best");
    check(contains(result.warnings, "evaluations failed"), "failures are reported in warnings");
}

void test_failure_score_does_not_steer() {
    // Valid candidates score 2e6 * g1, always above the default failure
    // score of 1e6; g0 > 15 diverges.
    ChatteringFitnessEvaluator evaluator(FitnessConfig{}, [](const GainVector& g) {
        if (g[0] > 15.0) throw SimulationDivergenceError("pendulum fell over");
        Trajectory traj;
        traj.dt = 1e-4;
        for (size_t k = 0; k < 100; ++k) {
            traj.control.push_back((k % 2 == 0 ? 100.0 : -100.0) * g[1]);
            traj.state_error.push_back({0.0, 0.0});
        }
        return traj;
    });
    SwarmConfig low_score = testSwarm();
    low_score.iterations = 40;
    SwarmConfig high_score = low_score;
    high_score.failure_fitness = 1e12;

    SwarmOptimizer a(makeControllerProfile(ControllerType::Classical), low_score);
    SwarmOptimizer b(makeControllerProfile(ControllerType::Classical), high_score);
    const OptimizationResult ra = a.run(evaluator);
    const OptimizationResult rb = b.run(evaluator);

    check(ra.best_fitness > 1e6, "valid fitness exceeds the failure score");
    check(ra.failed_evaluations == rb.failed_evaluations, "failure score does not change how often the swarm diverges");
    check(ra.best_gains == rb.best_gains && ra.cost_history == rb.cost_history,
          "failure score does not change the search");
    check(ra.best_gains[0] <= 15.0, "best gains come from the stable region");
}

void test_all_failed_throws() {
    ChatteringFitnessEvaluator evaluator(FitnessConfig{}, [](const GainVector&) -> Trajectory {
        throw std::runtime_error("solver error");
    });
    SwarmConfig cfg = testSwarm();
    cfg.n_particles = 5;
    cfg.iterations = 3;
    SwarmOptimizer optimizer(makeControllerProfile(ControllerType::Hybrid), cfg);
    bool thrown = false;
    try {
        optimizer.run(evaluator);
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()).find("all 20 evaluations failed") != std::string::npos;
    }
    check(thrown, "run throws when every evaluation failed");
}

void test_flat_objective_is_flagged() {
    // Constant control and perfect tracking: every candidate scores 0.0.
    ChatteringFitnessEvaluator evaluator(FitnessConfig{}, [](const GainVector&) {
        Trajectory traj;
        traj.control.assign(100, 1.0);
        traj.state_error.assign(100, {0.0, 0.0});
        return traj;
    });
    SwarmConfig cfg = testSwarm();
    cfg.n_particles = 10;
    cfg.iterations = 10;
    cfg.patience = 3;
    SwarmOptimizer optimizer(makeControllerProfile(ControllerType::Adaptive), cfg,
                             createEvaluationStrategy("openmp"));
    const OptimizationResult result = optimizer.run(evaluator);

    check(result.best_fitness == 0.0, "flat objective scores 0.0");
    check(result.iterations == 3 && result.cost_history.size() == 4, "stagnation stops the run early");
    check(contains(result.warnings, "identical across 10/10"), "flat population is flagged");
    check(contains(result.warnings, "cost history constant"), "flat cost history is flagged");
}

void test_fitness_monitor() {
    FitnessMonitor monitor(0.5, 4);
    check(!monitor.recordIteration(0, {1.0, 2.0, 3.0, 4.0}), "distinct fitness values are not flat");
    check(monitor.recordIteration(1, {0.0, 0.0, 0.0, 4.0}), "majority of identical values is flat");
    check(!monitor.recordIteration(2, {0.0, 0.0, 0.0}), "too few candidates are not judged");
    check(!monitor.recordIteration(3, {1.0, 1.0, 2.0, 3.0, 4.0}), "minority of identical values is not flat");
    check(monitor.flatIterations() == 1 && monitor.warnings().size() == 1, "one flat iteration recorded");

    monitor.recordBest(0.5);
    monitor.recordBest(0.25);
    monitor.finish();
    check(!monitor.historyFlat(), "decreasing history is not flat");

    FitnessMonitor stuck;
    for (int i = 0; i < 5; ++i) stuck.recordBest(0.0);
    stuck.finish();
    check(stuck.historyFlat(), "constant history is flat");

    bool rejected = false;
    try {
        FitnessMonitor bad(0.0);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    check(rejected, "monitor rejects a zero flat fraction");
}

void test_particle_bounds() {
    std::mt19937 gen(1);
    Particle p({1.0, 5.0}, {-3.0, 10.0});
    p.move({0.0, 0.0}, {10.0, 10.0});
    check(p.position[0] == 0.0 && p.position[1] == 10.0, "move projects onto the bounds");
    check(p.velocity[0] == 0.0 && p.velocity[1] == 0.0, "clamped components stop");

    check(p.recordFitness(2.0) && p.best_position == p.position, "first fitness sets the personal best");
    check(!p.recordFitness(3.0), "worse fitness keeps the personal best");

    p.updateVelocity({5.0, 5.0}, VelocityWeights{0.0, 0.0, 2.0}, {0.5, 0.5}, gen);
    check(std::abs(p.velocity[0]) <= 0.5 && std::abs(p.velocity[1]) <= 0.5, "velocity clamp");
    check(p.velocity[0] >= 0.0 && p.velocity[1] <= 0.0, "social term pulls towards the global best");
}

void test_thread_pool() {
    ThreadPool pool(3);
    check(pool.thread_count() == 3, "pool starts the requested workers");
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) futures.push_back(pool.enqueue([i]() { return i * i; }));
    int sum = 0;
    for (auto& f : futures) sum += f.get();
    check(sum == 2470, "every task result arrives through its future");

    auto failing = pool.enqueue([]() -> int { throw SimulationDivergenceError("task failed"); });
    bool rethrown = false;
    try {
        failing.get();
    } catch (const SimulationDivergenceError&) {
        rethrown = true;
    }
    check(rethrown, "task exceptions are rethrown by get()");
    check(ThreadPool(0).thread_count() == 1, "zero workers is raised to one");
}

void test_unknown_mode() {
    bool rejected = false;
    try {
        createEvaluationStrategy("gpu");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    check(rejected, "unknown evaluation mode is rejected");
}

int main() {
    test_converges_to_low_chattering();
    test_backends_agree();
    test_failed_evaluations_are_counted();
    test_failure_score_does_not_steer();
    test_all_failed_throws();
    test_flat_objective_is_flagged();
    test_fitness_monitor();
    test_particle_bounds();
    test_thread_pool();
    test_unknown_mode();
    std::cout << "All optimizer tests passed!" << std::endl;
    return 0;
}
