/*
  Pybind11 module exposing TrafficEq-Core to Python.

  Notes:
    - Network construction accepts NumPy arrays (C-contiguous), one array per
      link column, mirroring the columns of a parsed TNTP network table.
    - Link state views (flow/cost/capacity) are returned as fresh float64
      arrays; links are stored as records, not columns.
    - The iteration trace is returned as an (n, 2) array of
      (elapsed seconds, gap) for convergence plots.
*/
#include <pybind11/functional.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

#include "trafficeq/core/assignment.hpp"
#include "trafficeq/core/convergence.hpp"
#include "trafficeq/core/error.hpp"
#include "trafficeq/core/network.hpp"
#include "trafficeq/core/options.hpp"
#include "trafficeq/core/types.hpp"

namespace py = pybind11;
using namespace trafficeq::core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 1) throw py::type_error(std::string(name) + ": expected a 1-D array");
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

template <typename Getter>
static py::array_t<double> link_column(const TransportNetwork& net, Getter get) {
  const auto links = net.links();
  py::array_t<double> arr(static_cast<py::ssize_t>(links.size()));
  auto out = arr.mutable_unchecked<1>();
  for (std::size_t i = 0; i < links.size(); ++i) out(static_cast<py::ssize_t>(i)) = get(links[i]);
  return arr;
}

PYBIND11_MODULE(_trafficeq_core, m) {
  m.doc() = "TrafficEq-Core C++ bindings";

  py::register_exception<ValueError>(m, "ValueError", PyExc_ValueError);
  py::register_exception<AlgorithmError>(m, "AlgorithmError", PyExc_TypeError);

  py::enum_<Algorithm>(m, "Algorithm")
      .value("MSA", Algorithm::MSA)
      .value("FW", Algorithm::FrankWolfe)
      .value("CFW", Algorithm::ConjugateFrankWolfe)
      .value("GP", Algorithm::GradientProjection)
      .value("GP_E", Algorithm::GradientProjectionExact);

  py::enum_<CostFunctionKind>(m, "CostFunction")
      .value("BPR", CostFunctionKind::BPR)
      .value("CONSTANT", CostFunctionKind::Constant)
      .value("GREENSHIELDS", CostFunctionKind::Greenshields);

  py::enum_<AssignmentStatus>(m, "AssignmentStatus")
      .value("CONVERGED", AssignmentStatus::Converged)
      .value("MAX_ITERATIONS", AssignmentStatus::MaxIterations)
      .value("MAX_TIME", AssignmentStatus::MaxTime);

  m.def("parse_algorithm", [](const std::string& name){ return parse_algorithm(name); }, py::arg("name"));
  m.def("parse_cost_function", [](const std::string& name){ return parse_cost_function(name); }, py::arg("name"));

  py::class_<TransportNetwork>(m, "TransportNetwork")
      .def_static(
          "from_arrays",
          [](std::int32_t num_nodes,
             py::array init_node, py::array term_node,
             py::array capacity, py::array length, py::array free_flow_time,
             py::array b, py::array power, py::array speed, py::array toll, py::array link_type,
             py::array origin, py::array destination, py::array demand) {
            auto from_s = as_span<std::int32_t>(init_node, "init_node");
            auto to_s = as_span<std::int32_t>(term_node, "term_node");
            auto cap_s = as_span<double>(capacity, "capacity");
            auto len_s = as_span<double>(length, "length");
            auto fft_s = as_span<double>(free_flow_time, "free_flow_time");
            auto b_s = as_span<double>(b, "b");
            auto pow_s = as_span<double>(power, "power");
            auto speed_s = as_span<double>(speed, "speed");
            auto toll_s = as_span<double>(toll, "toll");
            auto type_s = as_span<std::int32_t>(link_type, "link_type");
            const std::size_t m_links = from_s.size();
            for (std::size_t n : {to_s.size(), cap_s.size(), len_s.size(), fft_s.size(), b_s.size(),
                                  pow_s.size(), speed_s.size(), toll_s.size(), type_s.size()}) {
              if (n != m_links) throw py::value_error("link arrays must have the same length");
            }
            std::vector<LinkSpec> specs(m_links);
            for (std::size_t i = 0; i < m_links; ++i) {
              specs[i] = LinkSpec{from_s[i], to_s[i], cap_s[i], len_s[i], fft_s[i],
                                  b_s[i], pow_s[i], speed_s[i], toll_s[i], type_s[i]};
            }
            auto o_s = as_span<std::int32_t>(origin, "origin");
            auto d_s = as_span<std::int32_t>(destination, "destination");
            auto v_s = as_span<double>(demand, "demand");
            if (o_s.size() != d_s.size() || o_s.size() != v_s.size()) {
              throw py::value_error("demand arrays must have the same length");
            }
            std::vector<Demand> dem(o_s.size());
            for (std::size_t i = 0; i < o_s.size(); ++i) dem[i] = Demand{o_s[i], d_s[i], v_s[i]};
            return TransportNetwork::from_parts(num_nodes, specs, dem);
          },
          py::arg("num_nodes"), py::arg("init_node"), py::arg("term_node"),
          py::arg("capacity"), py::arg("length"), py::arg("free_flow_time"),
          py::arg("b"), py::arg("power"), py::arg("speed"), py::arg("toll"), py::arg("link_type"),
          py::kw_only(), py::arg("origin"), py::arg("destination"), py::arg("demand"))
      .def("num_nodes", &TransportNetwork::num_nodes)
      .def("num_links", &TransportNetwork::num_links)
      .def("total_demand", &TransportNetwork::total_demand)
      .def("find_link", &TransportNetwork::find_link, py::arg("init_node"), py::arg("term_node"))
      .def("modify_capacity", &TransportNetwork::modify_capacity, py::arg("link"), py::arg("delta"))
      .def("reset", &TransportNetwork::reset)
      .def("reset_flow", &TransportNetwork::reset_flow)
      .def("init_node_view", [](const TransportNetwork& net){
        const auto links = net.links();
        py::array_t<std::int32_t> arr(static_cast<py::ssize_t>(links.size()));
        auto out = arr.mutable_unchecked<1>();
        for (std::size_t i = 0; i < links.size(); ++i) out(static_cast<py::ssize_t>(i)) = links[i].from;
        return arr;
      })
      .def("term_node_view", [](const TransportNetwork& net){
        const auto links = net.links();
        py::array_t<std::int32_t> arr(static_cast<py::ssize_t>(links.size()));
        auto out = arr.mutable_unchecked<1>();
        for (std::size_t i = 0; i < links.size(); ++i) out(static_cast<py::ssize_t>(i)) = links[i].to;
        return arr;
      })
      .def("flow_view", [](const TransportNetwork& net){ return link_column(net, [](const Link& l){ return l.flow; }); })
      .def("cost_view", [](const TransportNetwork& net){ return link_column(net, [](const Link& l){ return l.cost; }); })
      .def("capacity_view", [](const TransportNetwork& net){ return link_column(net, [](const Link& l){ return l.capacity; }); });

  py::class_<IterationRecord>(m, "IterationRecord")
      .def_readonly("iteration", &IterationRecord::iteration)
      .def_readonly("elapsed_seconds", &IterationRecord::elapsed_seconds)
      .def_readonly("gap", &IterationRecord::gap)
      .def_readonly("tstt", &IterationRecord::tstt)
      .def_readonly("sptt", &IterationRecord::sptt)
      .def_readonly("step", &IterationRecord::step);

  py::class_<AssignmentResult>(m, "AssignmentResult")
      .def_readonly("status", &AssignmentResult::status)
      .def_readonly("iterations", &AssignmentResult::iterations)
      .def_readonly("gap", &AssignmentResult::gap)
      .def_readonly("total_system_travel_time", &AssignmentResult::total_system_travel_time)
      .def_readonly("elapsed_seconds", &AssignmentResult::elapsed_seconds)
      .def_readonly("negative_gap_count", &AssignmentResult::negative_gap_count)
      .def("gaps", [](const AssignmentResult& r){
        py::array_t<double> arr({static_cast<py::ssize_t>(r.trace.size()), static_cast<py::ssize_t>(2)});
        auto out = arr.mutable_unchecked<2>();
        for (std::size_t i = 0; i < r.trace.size(); ++i) {
          out(static_cast<py::ssize_t>(i), 0) = r.trace[i].elapsed_seconds;
          out(static_cast<py::ssize_t>(i), 1) = r.trace[i].gap;
        }
        return arr;
      });

  m.def("assign",
        [](TransportNetwork& net, py::object algorithm, py::object cost_function,
           bool system_optimal, double accuracy, std::int32_t max_iterations,
           double max_time, double step_size, bool verbose, py::object on_iteration) {
          AssignmentOptions opts;
          // Accept either enum values or their string names ("FW", "GP-E", "BPR", ...)
          opts.algorithm = py::isinstance<py::str>(algorithm)
              ? parse_algorithm(algorithm.cast<std::string>()) : algorithm.cast<Algorithm>();
          opts.cost_function = py::isinstance<py::str>(cost_function)
              ? parse_cost_function(cost_function.cast<std::string>()) : cost_function.cast<CostFunctionKind>();
          opts.system_optimal = system_optimal;
          opts.accuracy = accuracy;
          opts.max_iterations = max_iterations;
          opts.max_time_seconds = max_time;
          opts.step_size = step_size;
          opts.verbose = verbose;
          if (!on_iteration.is_none()) {
            // Callback runs Python code, so the GIL stays held for this run.
            auto cb = on_iteration.cast<std::function<void(const IterationRecord&)>>();
            opts.on_iteration = cb;
            return assign(net, opts);
          }
          py::gil_scoped_release release;
          return assign(net, opts);
        },
        py::arg("network"), py::kw_only(),
        py::arg("algorithm") = "FW", py::arg("cost_function") = "BPR",
        py::arg("system_optimal") = false, py::arg("accuracy") = 1e-4,
        py::arg("max_iterations") = 1000, py::arg("max_time") = 60.0,
        py::arg("step_size") = 0.05, py::arg("verbose") = true,
        py::arg("on_iteration") = py::none());
}
