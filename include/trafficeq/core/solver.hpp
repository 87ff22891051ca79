/*
  EquilibriumSolver interface: abstracts link-based (MSA/FW/CFW) and
  path-based (GP/GP-E) flow updates behind one iteration step.

  The assignment loop (assignment.hpp) owns the iteration count, the gap and
  termination; a solver only moves flow and keeps link costs current.

  For Python developers:
  - std::unique_ptr<T>: single-owner pointer (freed when it goes out of scope)
  - virtual ... = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
*/
#pragma once

#include <cstdint>
#include <memory>

#include "trafficeq/core/cost_functions.hpp"
#include "trafficeq/core/network.hpp"
#include "trafficeq/core/options.hpp"

namespace trafficeq::core {

class EquilibriumSolver {
public:
  virtual ~EquilibriumSolver() noexcept = default;

  // Clear network flows (capacities are kept), recompute costs at zero flow
  // and drop any state from a previous run.
  virtual void start(TransportNetwork& net) = 0;

  // Perform iteration `iteration` (1-based). On return link flows and costs
  // reflect the update. Returns the step size applied.
  virtual double step(TransportNetwork& net, std::int32_t iteration) = 0;

  [[nodiscard]] virtual const CostModel& cost_model() const noexcept = 0;
  [[nodiscard]] virtual Algorithm algorithm() const noexcept = 0;
};

using SolverPtr = std::unique_ptr<EquilibriumSolver>;

// Build the solver for opts.algorithm. Throws AlgorithmError for an
// unrecognized algorithm value.
[[nodiscard]] SolverPtr make_solver(const AssignmentOptions& opts);

} // namespace trafficeq::core
