/*
  Assignment loop and solver factory.

  Reset -> { solver step -> gap } -> Converged / MaxIterations / MaxTime.
  Budgets are checked once per iteration; there is no mid-iteration
  cancellation.
*/
#include "trafficeq/core/assignment.hpp"

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "trafficeq/core/error.hpp"
#include "trafficeq/core/link_based.hpp"
#include "trafficeq/core/path_based.hpp"

namespace trafficeq::core {

SolverPtr make_solver(const AssignmentOptions& opts) {
  const CostModel model{opts.cost_function, opts.system_optimal};
  switch (opts.algorithm) {
    case Algorithm::MSA:
    case Algorithm::FrankWolfe:
    case Algorithm::ConjugateFrankWolfe:
      return std::make_unique<LinkBasedSolver>(opts.algorithm, model, opts.line_search);
    case Algorithm::GradientProjection:
    case Algorithm::GradientProjectionExact:
      return std::make_unique<GradientProjectionSolver>(opts.algorithm, model, opts.step_size, opts.line_search);
  }
  throw AlgorithmError("make_solver: unrecognized algorithm value " +
                       std::to_string(static_cast<int>(opts.algorithm)));
}

AssignmentResult assign(TransportNetwork& net, const AssignmentOptions& opts) {
  validate(opts);
  auto solver = make_solver(opts);
  return assign(net, *solver, opts);
}

AssignmentResult assign(TransportNetwork& net, EquilibriumSolver& solver,
                        const AssignmentOptions& opts) {
  validate(opts);
  const CostModel& model = solver.cost_model();
  if (opts.verbose) {
    spdlog::info("Computing {} assignment ({}, {}) on {} nodes, {} links, {} OD pairs",
                 model.system_optimal ? "SO" : "UE", to_string(solver.algorithm()),
                 to_string(model.kind), net.num_nodes(), net.num_links(),
                 net.demands().size());
  }
  ConvergenceMonitor monitor(opts);
  solver.start(net);
  for (std::int32_t iteration = 1;; ++iteration) {
    const double step = solver.step(net, iteration);
    monitor.observe(net, iteration, step);
    if (auto status = monitor.verdict()) {
      return monitor.finish(net, model, *status);
    }
  }
}

} // namespace trafficeq::core
