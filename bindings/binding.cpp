#include <pybind11/pybind11.h>
#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include <limits>
#include <sstream>

#include "Criterion.h"
#include "EndCondition.h"
#include "Exceptions.h"
#include "Logger.h"
#include "MultiTrajResult.h"
#include "ResultOptions.h"
#include "Trajectory.h"
#include "TrajectoryRunner.h"


namespace py = pybind11;
using namespace ensemble;


static TargetTolerance to_tolerance(const py::object& obj) {
     if (py::isinstance<py::float_>(obj) || py::isinstance<py::int_>(obj))
          return TargetTolerance(obj.cast<double>());

     if (py::isinstance<py::sequence>(obj) && !py::isinstance<py::str>(obj)) {
          const auto seq = obj.cast<py::sequence>();
          const bool nested = py::len(seq) > 0 && py::isinstance<py::sequence>(seq[0]);
          if (!nested && py::len(seq) == 2)
               return TargetTolerance(seq[0].cast<double>(), seq[1].cast<double>());
          if (nested)
               return TargetTolerance(obj.cast<std::vector<std::vector<double>>>());
     }
     throw ConfigurationError("target_tol",
                              "target_tol must be a number, a pair of (atol, rtol) or a list of (atol, rtol) "
                              "for each e_ops");
}

static LogLevel to_log_level(const std::string& name) {
     try {
          return parseLogLevel(name);
     }
     catch (const std::invalid_argument& e) {
          throw py::value_error(e.what());
     }
}


PYBIND11_MODULE(_ensemble, m) {
     m.doc() = "Streaming aggregation of Monte-Carlo trajectory ensembles";

     // Exceptions
     auto aggregationError = py::register_exception<AggregationError>(m, "AggregationError", PyExc_ValueError);
     py::register_exception<ShapeMismatch>(m, "ShapeMismatch", aggregationError.ptr());
     py::register_exception<ConfigurationError>(m, "ConfigurationError", aggregationError.ptr());
     py::register_exception<IncompatibleAggregations>(m, "IncompatibleAggregations", aggregationError.ptr());

     // Logging
     m.def("set_log_level", [](const std::string& name) { Logger::getInstance().setLogLevel(to_log_level(name)); },
           py::arg("level"), "One of DEBUG, INFO, WARNING, ERROR, NONE.");

     // Trajectory
     py::class_<CollapseEvent>(m, "CollapseEvent")
          .def(py::init([](const double time, const int channel) { return CollapseEvent{time, channel}; }),
               py::arg("time"),
               py::arg("channel")
          )
          .def_readwrite("time", &CollapseEvent::time)
          .def_readwrite("channel", &CollapseEvent::channel);

     py::class_<Trajectory>(m, "Trajectory")
          .def(py::init<>())
          .def_readwrite("seed", &Trajectory::seed)
          .def_readwrite("times", &Trajectory::times)
          .def_readwrite("states", &Trajectory::states)
          .def_readwrite("final_state", &Trajectory::finalState)
          .def_readwrite("expect", &Trajectory::expect)
          .def_readwrite("collapse", &Trajectory::collapses)
          .def_readwrite("trace", &Trajectory::trace);

     py::class_<ResultOptions>(m, "ResultOptions")
          .def(py::init([](const std::optional<bool> storeStates, const bool storeFinalState,
                           const bool keepRunsResults) {
                    return ResultOptions{storeStates, storeFinalState, keepRunsResults};
               }),
               py::arg("store_states") = py::none(),
               py::arg("store_final_state") = false,
               py::arg("keep_runs_results") = false
          )
          .def_readwrite("store_states", &ResultOptions::storeStates)
          .def_readwrite("store_final_state", &ResultOptions::storeFinalState)
          .def_readwrite("keep_runs_results", &ResultOptions::keepRunsResults);

     // Result
     py::class_<MultiTrajResult>(m, "MultiTrajResult")
          .def(py::init<std::vector<std::string>, const ResultOptions&, std::string>(),
               py::arg("e_ops"),
               py::arg("options") = ResultOptions{},
               py::arg("solver") = ""
          )
          .def_static("mc", &MultiTrajResult::monteCarlo,
                      py::arg("e_ops"),
                      py::arg("options"),
                      py::arg("num_collapse"),
                      py::arg("solver") = "mcsolve"
          )
          .def_static("nm_mc", &MultiTrajResult::nonMarkovian,
                      py::arg("e_ops"),
                      py::arg("options"),
                      py::arg("num_collapse"),
                      py::arg("solver") = "nm_mcsolve"
          )
          .def("add_end_condition",
               [](MultiTrajResult& self, const std::int64_t ntraj, const py::object& targetTol) {
                    if (targetTol.is_none())
                         self.addEndCondition(ntraj);
                    else
                         self.addEndCondition(ntraj, to_tolerance(targetTol));
               },
               py::arg("ntraj"),
               py::arg("target_tol") = py::none()
          )
          .def("add", &MultiTrajResult::add, py::arg("trajectory"))
          .def("merge", &MultiTrajResult::merge, py::arg("other"))
          .def("__add__", &MultiTrajResult::merge)
          .def_property_readonly("num_trajectories", &MultiTrajResult::numTrajectories)
          .def_property_readonly("times", &MultiTrajResult::times)
          .def_property_readonly("seeds", &MultiTrajResult::seeds)
          .def_property_readonly("end_condition", [](const MultiTrajResult& r) { return toString(r.endCondition()); })
          .def_property_readonly("average_expect", &MultiTrajResult::averageExpect)
          .def_property_readonly("std_expect", &MultiTrajResult::stdExpect)
          .def_property_readonly("runs_expect", &MultiTrajResult::runsExpect)
          .def_property_readonly("average_e_data", &MultiTrajResult::averageEData)
          .def_property_readonly("std_e_data", &MultiTrajResult::stdEData)
          .def_property_readonly("average_states", &MultiTrajResult::averageStates)
          .def_property_readonly("average_final_state", &MultiTrajResult::averageFinalState)
          .def_property_readonly("runs_states", &MultiTrajResult::runsStates)
          .def_property_readonly("runs_final_states", &MultiTrajResult::runsFinalStates)
          .def("steady_state", &MultiTrajResult::steadyState, py::arg("N") = 0)
          .def_property_readonly("col_times", &MultiTrajResult::colTimes)
          .def_property_readonly("col_which", &MultiTrajResult::colWhich)
          .def_property_readonly("photocurrent", &MultiTrajResult::photocurrent)
          .def_property_readonly("runs_photocurrent", &MultiTrajResult::runsPhotocurrent)
          .def_property_readonly("average_trace", &MultiTrajResult::averageTrace)
          .def_property_readonly("std_trace", &MultiTrajResult::stdTrace)
          .def_property_readonly("runs_trace", &MultiTrajResult::runsTrace)
          .def_property_readonly("stats", [](const MultiTrajResult& r) {
               const ResultStats s = r.stats();
               py::dict d;
               d["solver"] = s.solver;
               d["end_condition"] = toString(s.endCondition);
               d["num_trajectories"] = s.numTrajectories;
               d["run time"] = s.runTime;
               if (r.tracksCollapses()) d["num_collapse"] = s.numCollapse;
               if (s.estimatedNtraj) d["estimated_ntraj"] = *s.estimatedNtraj;
               return d;
          })
          .def("__repr__", [](const MultiTrajResult& r) {
               std::ostringstream os;
               os << r;
               return os.str();
          });

     m.def("merge_all", &mergeAll, py::arg("results"));

     // Runner
     py::class_<TrajectoryRunner>(m, "TrajectoryRunner")
          .def(py::init([](const MultiTrajResult& prototype, const py::function& generator, const std::int64_t ntraj,
                           const int chunkSize, const int maxWorkers, const std::uint64_t baseSeed,
                           const double timeout) {
                    // the generator re-acquires the GIL for every call
                    TrajectoryRunner::Generator gen = [generator](const std::uint64_t seed) {
                         py::gil_scoped_acquire gil;
                         return generator(seed).cast<Trajectory>();
                    };
                    return std::make_unique<TrajectoryRunner>(prototype, std::move(gen), ntraj, chunkSize,
                                                              maxWorkers, baseSeed, timeout);
               }),
               py::arg("prototype"),
               py::arg("generator"),
               py::arg("ntraj"),
               py::arg("chunk_size") = 1,
               py::arg("max_workers") = 1,
               py::arg("base_seed") = 0,
               py::arg("timeout") = std::numeric_limits<double>::infinity(),
               py::keep_alive<1, 3>() // generator
          )
          .def("run", &TrajectoryRunner::run, py::call_guard<py::gil_scoped_release>());
}
