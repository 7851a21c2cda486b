// src/python_bindings/binding.cpp
//
// PyBind11 bindings for the **ChatteringOptimizationEngine** framework.
// Exposes the fitness evaluator, the swarm optimizer and result persistence to
// the Python orchestration layer, where the closed-loop simulation of the
// double inverted pendulum lives.
//
// The simulation is supplied as a Python callable `simulate(gains) -> Trajectory`.
// It is wrapped into a `SimulationFn` that re-acquires the GIL for every call, so
// `SwarmOptimizer.run` can release the GIL and still drive Python simulations
// from the thread-pool or OpenMP back-ends. Python exceptions raised by the
// callable surface as simulation divergence for that candidate.
//
// Key bindings:
// • `Trajectory`, `FitnessConfig`, `SwarmConfig`, `ControllerProfile`: plain records.
// • `ChatteringFitnessEvaluator`: built from a callable and a measure name.
// • `SwarmOptimizer`: created through the `create_optimizer` factory.
// • `save_result`, `result_path_for`: verbatim-path JSON persistence.
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <memory>
#include "Engine.hpp"
#include "FitnessEvaluator.hpp"
#include "ResultWriter.hpp"
#include "TunerConfig.hpp"
namespace py = pybind11;

namespace {

BoundsProfile parseBoundsProfile(const std::string& name) {
    if (name == "aggressive") return BoundsProfile::Aggressive;
    if (name == "balanced") return BoundsProfile::Balanced;
    if (name == "conservative") return BoundsProfile::Conservative;
    throw std::invalid_argument("Unknown bounds profile: " + name);
}

/**
 * @brief Wraps a Python callable as a thread-safe SimulationFn.
 *
 * The callable is released under the GIL when the last copy of the wrapper
 * goes away.
 */
SimulationFn wrapSimulation(py::function fn) {
    std::shared_ptr<py::function> holder(new py::function(std::move(fn)), [](py::function* f) {
        py::gil_scoped_acquire gil;
        delete f;
    });
    return [holder](const GainVector& gains) -> Trajectory {
        py::gil_scoped_acquire gil;
        try {
            return (*holder)(gains).cast<Trajectory>();
        } catch (py::error_already_set& e) {
            throw SimulationDivergenceError(e.what());
        } catch (const py::cast_error& e) {
            throw SimulationDivergenceError(std::string("simulate() did not return a Trajectory: ") +
                                            e.what());
        }
    };
}

} // namespace

/**
 * @brief Factory function to create a swarm optimizer for a controller and mode.
 *
 * @param controller Controller name ("classical_smc", "adaptive", "sta", ...).
 * @param mode Evaluation mode ("sequential", "cpu", "threadpool", "openmp").
 * @param cfg PSO hyper-parameters.
 * @param bounds Bound preset ("aggressive", "balanced", "conservative").
 * @return SwarmOptimizer* Pointer to the created optimizer (Python manages ownership).
 *
 * Throws std::invalid_argument for unknown names or unusable settings.
 */
SwarmOptimizer* create_optimizer(const std::string& controller, const std::string& mode,
                                 const SwarmConfig& cfg, const std::string& bounds) {
    ControllerProfile profile = makeControllerProfile(parseControllerType(controller),
                                                      parseBoundsProfile(bounds));
    return new SwarmOptimizer(std::move(profile), cfg, createEvaluationStrategy(mode));
}

/**
 * @brief PyBind11 module definition: `coe_bindings`
 */
PYBIND11_MODULE(coe_bindings, m) {
    m.doc() = "Python bindings for ChatteringOptimizationEngine";

    py::register_exception<SimulationDivergenceError>(m, "SimulationDivergenceError", PyExc_RuntimeError);
    py::register_exception<EmptyTrajectoryError>(m, "EmptyTrajectoryError", PyExc_RuntimeError);
    py::register_exception<DegeneratePathError>(m, "DegeneratePathError", PyExc_RuntimeError);

    py::class_<Trajectory>(m, "Trajectory")
        .def(py::init<>())
        .def(py::init([](double dt, std::vector<double> control,
                         std::vector<std::vector<double>> state_error) {
                 Trajectory traj;
                 traj.dt = dt;
                 traj.control = std::move(control);
                 traj.state_error = std::move(state_error);
                 return traj;
             }),
             py::arg("dt"), py::arg("control"), py::arg("state_error"))
        .def_readwrite("dt", &Trajectory::dt)
        .def_readwrite("control", &Trajectory::control)
        .def_readwrite("state_error", &Trajectory::state_error);

    py::class_<FitnessConfig>(m, "FitnessConfig")
        .def(py::init<>())
        .def_readwrite("tracking_threshold", &FitnessConfig::tracking_threshold)
        .def_readwrite("penalty_scale", &FitnessConfig::penalty_scale)
        .def_readwrite("divergence_bound", &FitnessConfig::divergence_bound);

    py::class_<FitnessBreakdown>(m, "FitnessBreakdown")
        .def_readonly("chattering_index", &FitnessBreakdown::chattering_index)
        .def_readonly("tracking_rms", &FitnessBreakdown::tracking_rms)
        .def_readonly("penalty", &FitnessBreakdown::penalty)
        .def_readonly("fitness", &FitnessBreakdown::fitness)
        .def_readonly("control_effort_rms", &FitnessBreakdown::control_effort_rms)
        .def_readonly("total_variation", &FitnessBreakdown::total_variation)
        .def_readonly("smoothness_index", &FitnessBreakdown::smoothness_index);

    py::class_<AcceptanceReport>(m, "AcceptanceReport")
        .def_readonly("chattering", &AcceptanceReport::chattering)
        .def_readonly("tracking", &AcceptanceReport::tracking)
        .def_readonly("smoothness", &AcceptanceReport::smoothness)
        .def("passed", &AcceptanceReport::passed)
        .def("all", &AcceptanceReport::all);

    py::class_<SwarmConfig>(m, "SwarmConfig")
        .def(py::init<>())
        .def_readwrite("n_particles", &SwarmConfig::n_particles)
        .def_readwrite("iterations", &SwarmConfig::iterations)
        .def_readwrite("w", &SwarmConfig::w)
        .def_readwrite("c1", &SwarmConfig::c1)
        .def_readwrite("c2", &SwarmConfig::c2)
        .def_readwrite("use_w_schedule", &SwarmConfig::use_w_schedule)
        .def_readwrite("w_end", &SwarmConfig::w_end)
        .def_readwrite("velocity_clamp", &SwarmConfig::velocity_clamp)
        .def_readwrite("seed", &SwarmConfig::seed)
        .def_readwrite("failure_fitness", &SwarmConfig::failure_fitness)
        .def_readwrite("tolerance", &SwarmConfig::tolerance)
        .def_readwrite("patience", &SwarmConfig::patience)
        .def_readwrite("verbose", &SwarmConfig::verbose);

    py::class_<ControllerProfile>(m, "ControllerProfile")
        .def_property_readonly("controller", [](const ControllerProfile& p) { return toString(p.type); })
        .def_readonly("lower", &ControllerProfile::lower)
        .def_readonly("upper", &ControllerProfile::upper)
        .def("gainCount", &ControllerProfile::gainCount);

    py::class_<OptimizationResult>(m, "OptimizationResult")
        .def_property_readonly("controller", [](const OptimizationResult& r) { return toString(r.controller); })
        .def_readonly("best_gains", &OptimizationResult::best_gains)
        .def_readonly("best_fitness", &OptimizationResult::best_fitness)
        .def_readonly("best_breakdown", &OptimizationResult::best_breakdown)
        .def_readonly("acceptance", &OptimizationResult::acceptance)
        .def_readonly("cost_history", &OptimizationResult::cost_history)
        .def_readonly("iterations", &OptimizationResult::iterations)
        .def_readonly("evaluations", &OptimizationResult::evaluations)
        .def_readonly("failed_evaluations", &OptimizationResult::failed_evaluations)
        .def_readonly("time_taken", &OptimizationResult::time_taken)
        .def_readonly("strategy", &OptimizationResult::strategy)
        .def_readonly("warnings", &OptimizationResult::warnings)
        .def("to_json", [](const OptimizationResult& r) { return toJson(r); });

    py::class_<ChatteringFitnessEvaluator>(m, "ChatteringFitnessEvaluator")
        .def(py::init([](const FitnessConfig& cfg, py::function simulate, const std::string& measure) {
                 return new ChatteringFitnessEvaluator(cfg, wrapSimulation(std::move(simulate)),
                                                       createChatteringMeasure(measure));
             }),
             py::arg("config"), py::arg("simulate"), py::arg("measure") = "derivative_rms")
        .def("evaluate", &ChatteringFitnessEvaluator::evaluate)
        .def("evaluate_trajectory", &ChatteringFitnessEvaluator::evaluateTrajectory)
        .def("__call__", &ChatteringFitnessEvaluator::operator())
        .def_property_readonly("measure", [](const ChatteringFitnessEvaluator& e) { return e.measure().name(); });

    py::class_<SwarmOptimizer>(m, "SwarmOptimizer")
        .def("run", &SwarmOptimizer::run, py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("profile", &SwarmOptimizer::profile)
        .def_property_readonly("strategy", [](const SwarmOptimizer& o) { return o.strategy().name(); });

    m.def("make_controller_profile",
          [](const std::string& controller, const std::string& bounds) {
              return makeControllerProfile(parseControllerType(controller), parseBoundsProfile(bounds));
          },
          py::arg("controller"), py::arg("bounds") = "balanced",
          "Search bounds of a controller variant");
    m.def("create_optimizer", &create_optimizer, py::arg("controller"), py::arg("mode"),
          py::arg("swarm_cfg"), py::arg("bounds") = "balanced",
          "Create a swarm optimizer for a controller with the specified evaluation mode");
    m.def("save_result", &saveResult, py::arg("path"), py::arg("result"),
          "Write a result to exactly the given path");
    m.def("result_path_for",
          [](const std::filesystem::path& dir, const std::string& controller) {
              return resultPathFor(dir, parseControllerType(controller));
          },
          py::arg("output_dir"), py::arg("controller"),
          "Default per-controller result file inside an output directory");
}
