/*
  Convergence monitoring shared by link- and path-based solvers: relative
  gap, total travel time accounting, termination checks and the
  per-iteration diagnostics trace.
*/
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "trafficeq/core/cost_functions.hpp"
#include "trafficeq/core/network.hpp"
#include "trafficeq/core/options.hpp"
#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

struct IterationRecord {
  std::int32_t iteration { 0 };
  double elapsed_seconds { 0.0 };
  double gap { 0.0 };
  Cost tstt { 0.0 };   // sum(flow * cost) on the routing cost
  Cost sptt { 0.0 };   // shortest-path total travel time
  double step { 0.0 }; // step size applied this iteration
};

struct AssignmentResult {
  AssignmentStatus status { AssignmentStatus::MaxIterations };
  std::int32_t iterations { 0 };
  double gap { 0.0 };
  // Real travel time sum(flow * travel_time(flow)); differs from the routing
  // TSTT when routing on marginal cost. Evaluated at the links' current
  // capacity, so capacity modifications are reflected.
  Cost total_system_travel_time { 0.0 };
  double elapsed_seconds { 0.0 };
  std::int32_t negative_gap_count { 0 };
  std::vector<IterationRecord> trace;
};

// sum(flow * cost) with the link costs currently stored on the network.
[[nodiscard]] Cost total_travel_time(const TransportNetwork& net) noexcept;

// sum(flow * travel time), evaluating the model's user (non-marginal) cost.
[[nodiscard]] Cost system_travel_time(const TransportNetwork& net, const CostModel& model) noexcept;

// TSTT / SPTT - 1. With SPTT == 0: 0 if TSTT == 0, +inf otherwise.
[[nodiscard]] double relative_gap(Cost tstt, Cost sptt) noexcept;

class ConvergenceMonitor {
public:
  explicit ConvergenceMonitor(const AssignmentOptions& opts);

  // Measures TSTT, SPTT and the gap on the current network state (link costs
  // must be current), appends the record and notifies opts.on_iteration.
  void observe(const TransportNetwork& net, std::int32_t iteration, double step);

  // Termination for the latest record: gap <= accuracy, then the iteration
  // limit, then the time limit. nullopt means keep iterating.
  [[nodiscard]] std::optional<AssignmentStatus> verdict() const;

  [[nodiscard]] AssignmentResult finish(const TransportNetwork& net, const CostModel& model,
                                        AssignmentStatus status);

  [[nodiscard]] double elapsed_seconds() const;

private:
  const AssignmentOptions* opts_ {nullptr};
  std::chrono::steady_clock::time_point start_;
  std::vector<IterationRecord> trace_ {};
  std::int32_t negative_gaps_ {0};
  bool warned_unreachable_ {false};
};

} // namespace trafficeq::core
