// src/core/test_persistence.cpp
//
// CTest suite for result persistence and multi-controller campaigns.
// saveResult() must write to exactly the path it is given (never
// `<path>/<file name>`), reject self-joined `<name>/<name>` paths, and the
// campaign must persist one file per controller plus a summary whether its
// runs execute sequentially or in parallel.

#include "ResultWriter.hpp"
#include "TuningCampaign.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void check(bool condition, const std::string& name) {
    if (!condition) {
        std::cerr << "Test failed: " << name << std::endl;
        std::exit(1);
    }
    std::cout << "Test passed: " << name << std::endl;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

fs::path freshDir(const std::string& name) {
    const fs::path dir = fs::temp_directory_path() / ("coe_" + name);
    fs::remove_all(dir);
    return dir;
}

OptimizationResult sampleResult() {
    OptimizationResult result;
    result.controller = ControllerType::SuperTwisting;
    result.best_gains = {8.0, 4.5, 12.0, 6.0, 4.85, 3.43};
    result.best_fitness = 1.25;
    result.best_breakdown.chattering_index = 1.25;
    result.best_breakdown.tracking_rms = 0.04;
    result.best_breakdown.smoothness_index = 0.8;
    result.best_breakdown.fitness = 1.25;
    result.acceptance = checkAcceptance(result.best_breakdown);
    result.cost_history = {3.0, 2.0, 1.25};
    result.iterations = 2;
    result.evaluations = 30;
    result.strategy = "sequential";
    result.warnings = {"iteration 1: \"flat\""};
    return result;
}

// Switching amplitude shrinks with gain 1; tracking error shrinks with gain 0.
SimulationFn stubSimulation(ControllerType type) {
    const double scale = (type == ControllerType::Hybrid) ? 2.0 : 1.0;
    return [scale](const GainVector& g) {
        Trajectory traj;
        traj.dt = 0.01;
        for (size_t k = 0; k < 100; ++k) {
            traj.control.push_back((k % 2 == 0 ? 1.0 : -1.0) * 0.001 * scale * g[1]);
            traj.state_error.push_back({0.1 / g[0], 0.05 / g[0]});
        }
        return traj;
    };
}

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

} // namespace

void test_verbatim_path() {
    const fs::path dir = freshDir("verbatim");
    const fs::path target = dir / "nested" / "gains_sta_smc_chattering.json";
    saveResult(target, sampleResult());

    check(fs::is_regular_file(target), "result written to exactly the given path");
    check(!fs::exists(target / target.filename()), "file name is not joined onto the path");
    const std::string json = readFile(target);
    check(json.find("\"controller_type\": \"sta_smc\"") != std::string::npos, "controller type persisted");
    check(json.find("\"best_gains\": [8, 4.5, 12, 6, 4.8499999999999996, 3.4300000000000002]") != std::string::npos,
          "gains persisted with full precision");
    check(json.find("\"criteria_passed\": 3") != std::string::npos, "acceptance persisted");
    check(json.find("\\\"flat\\\"") != std::string::npos, "warning text is escaped");

    saveResult(target, sampleResult());
    check(fs::is_regular_file(target), "existing result file is overwritten in place");
    fs::remove_all(dir);
}

void test_degenerate_path_rejected() {
    const fs::path dir = freshDir("degenerate");
    const fs::path bad = dir / "gains.json" / "gains.json";
    check(throws<DegeneratePathError>([&] { saveResult(bad, sampleResult()); }),
          "self-joined path is rejected");
    check(!fs::exists(dir / "gains.json"), "nothing is created for a rejected path");
    check(throws<DegeneratePathError>([&] { checkOutputPath("out/a.json/a.json"); }),
          "checkOutputPath rejects <name>/<name>");
    checkOutputPath("out/a.json");
    checkOutputPath("a.json");
    check(throws<std::runtime_error>([&] { checkOutputPath("out/"); }), "path without file name is rejected");
}

void test_result_path_for() {
    check(resultPathFor("results", ControllerType::Classical) ==
              fs::path("results") / "gains_classical_smc_chattering.json",
          "classical result path");
    check(resultPathFor("results", ControllerType::Hybrid).filename().string() ==
              "gains_hybrid_adaptive_sta_smc_chattering.json",
          "hybrid result path");
}

void test_campaign(bool parallel) {
    const std::string label = parallel ? "parallel" : "sequential";
    const fs::path dir = freshDir("campaign_" + label);

    SwarmConfig swarm;
    swarm.n_particles = 12;
    swarm.iterations = 15;
    swarm.c1 = 1.5;
    swarm.c2 = 1.5;
    TuningCampaign campaign(FitnessConfig{}, swarm, stubSimulation, "threadpool");
    const std::vector<ControllerType> controllers = {ControllerType::Classical, ControllerType::Adaptive,
                                                     ControllerType::SuperTwisting, ControllerType::Hybrid};
    const std::vector<OptimizationResult> results = campaign.runAndSave(controllers, dir, parallel);

    check(results.size() == controllers.size(), label + " campaign returns one result per controller");
    for (size_t i = 0; i < controllers.size(); ++i) {
        check(results[i].controller == controllers[i], label + " campaign keeps input order");
        check(results[i].best_gains.size() == makeControllerProfile(controllers[i]).gainCount(),
              label + " campaign uses each controller's arity");
        const fs::path file = resultPathFor(dir, controllers[i]);
        check(fs::is_regular_file(file), label + " campaign writes " + file.filename().string());
    }
    const std::string summary = readFile(dir / "optimization_summary.json");
    check(summary.find("\"controllers_optimized\": [\"classical_smc\", \"adaptive_smc\", \"sta_smc\", "
                       "\"hybrid_adaptive_sta_smc\"]") != std::string::npos,
          label + " campaign summary lists the controllers");
    fs::remove_all(dir);
}

void test_campaign_determinism() {
    SwarmConfig swarm;
    swarm.n_particles = 10;
    swarm.iterations = 10;
    TuningCampaign sequential(FitnessConfig{}, swarm, stubSimulation);
    TuningCampaign pooled(FitnessConfig{}, swarm, stubSimulation, "openmp");
    const std::vector<ControllerType> controllers = {ControllerType::Adaptive, ControllerType::Hybrid};
    const auto a = sequential.run(controllers, false);
    const auto b = pooled.run(controllers, true);
    for (size_t i = 0; i < controllers.size(); ++i) {
        check(a[i].best_gains == b[i].best_gains, "parallel campaign matches the sequential one");
    }
    check(throws<std::invalid_argument>([&] {
              TuningCampaign bad(FitnessConfig{}, swarm, stubSimulation, "sequential", "wavelet");
          }),
          "campaign rejects an unknown chattering measure");
}

int main() {
    test_verbatim_path();
    test_degenerate_path_rejected();
    test_result_path_for();
    test_campaign(false);
    test_campaign(true);
    test_campaign_determinism();
    std::cout << "All persistence tests passed!" << std::endl;
    return 0;
}
