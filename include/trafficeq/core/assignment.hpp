/* Traffic assignment entry point: runs the selected solver to convergence. */
#pragma once

#include "trafficeq/core/convergence.hpp"
#include "trafficeq/core/network.hpp"
#include "trafficeq/core/options.hpp"
#include "trafficeq/core/solver.hpp"

namespace trafficeq::core {

// Validates opts, resets network flows (capacity modifications are kept),
// then iterates the selected algorithm until the relative gap drops to
// opts.accuracy or the iteration/time budget is spent. Final link flows and
// costs stay on `net`. The network must not be used concurrently.
// Throws ValueError for invalid options and AlgorithmError for an
// unrecognized algorithm, both before any flow is changed.
[[nodiscard]] AssignmentResult assign(TransportNetwork& net, const AssignmentOptions& opts);

// Same loop with a caller-provided solver. The solver's algorithm and cost
// model take precedence over the ones named in opts.
[[nodiscard]] AssignmentResult assign(TransportNetwork& net, EquilibriumSolver& solver,
                                      const AssignmentOptions& opts);

} // namespace trafficeq::core
