/*
  ConvergenceMonitor: gap measurement and termination for assignment runs.

  The gap needs a fresh shortest-path total on the post-update costs, so
  observe() runs one all-or-nothing pass without building auxiliary flows.
  A negative gap means SPTT exceeded TSTT, which a consistent solver state
  cannot produce; it is logged and counted but does not stop the run.
*/
#include "trafficeq/core/convergence.hpp"

#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

#include "trafficeq/core/loading.hpp"

namespace trafficeq::core {

Cost total_travel_time(const TransportNetwork& net) noexcept {
  Cost total = 0.0;
  for (const auto& l : net.links()) total += l.flow * l.cost;
  return total;
}

Cost system_travel_time(const TransportNetwork& net, const CostModel& model) noexcept {
  const CostModel user = model.travel_time();
  Cost total = 0.0;
  for (const auto& l : net.links()) total += l.flow * user.cost(l, l.flow);
  return total;
}

double relative_gap(Cost tstt, Cost sptt) noexcept {
  if (sptt == 0.0) {
    return tstt == 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
  }
  return tstt / sptt - 1.0;
}

ConvergenceMonitor::ConvergenceMonitor(const AssignmentOptions& opts)
    : opts_(&opts), start_(std::chrono::steady_clock::now()) {}

double ConvergenceMonitor::elapsed_seconds() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

void ConvergenceMonitor::observe(const TransportNetwork& net,
                                                   std::int32_t iteration, double step) {
  const auto aon = all_or_nothing(net, /*with_aux_flow=*/false);
  if (aon.unreachable_pairs > 0 && !warned_unreachable_) {
    spdlog::warn("{} OD pairs with positive demand have no route; their demand is not assigned",
                 aon.unreachable_pairs);
    warned_unreachable_ = true;
  }

  IterationRecord rec;
  rec.iteration = iteration;
  rec.tstt = total_travel_time(net);
  rec.sptt = aon.sptt;
  rec.gap = relative_gap(rec.tstt, rec.sptt);
  rec.step = step;
  rec.elapsed_seconds = elapsed_seconds();

  if (rec.gap < 0.0) {
    ++negative_gaps_;
    spdlog::warn("iteration {}: negative relative gap {:.3e} (TSTT={:.9f}, SPTT={:.9f})",
                 iteration, rec.gap, rec.tstt, rec.sptt);
  }
  spdlog::debug("iteration {}: step={:.6f} TSTT={:.6f} SPTT={:.6f} gap={:.3e}",
                iteration, rec.step, rec.tstt, rec.sptt, rec.gap);

  trace_.push_back(rec);
  if (opts_->on_iteration) opts_->on_iteration(trace_.back());
}

std::optional<AssignmentStatus> ConvergenceMonitor::verdict() const {
  if (trace_.empty()) return std::nullopt;
  const auto& rec = trace_.back();
  if (rec.gap <= opts_->accuracy) return AssignmentStatus::Converged;
  if (rec.iteration >= opts_->max_iterations) return AssignmentStatus::MaxIterations;
  if (rec.elapsed_seconds > opts_->max_time_seconds) return AssignmentStatus::MaxTime;
  return std::nullopt;
}

AssignmentResult ConvergenceMonitor::finish(const TransportNetwork& net, const CostModel& model,
                                            AssignmentStatus status) {
  AssignmentResult res;
  res.status = status;
  res.iterations = trace_.empty() ? 0 : trace_.back().iteration;
  res.gap = trace_.empty() ? std::numeric_limits<double>::infinity() : trace_.back().gap;
  res.total_system_travel_time = system_travel_time(net, model);
  res.elapsed_seconds = elapsed_seconds();
  res.negative_gap_count = negative_gaps_;
  res.trace = std::move(trace_);
  trace_.clear();

  if (opts_->verbose) {
    switch (status) {
      case AssignmentStatus::Converged:
        spdlog::info("Assignment converged in {} iterations ({:.5f} s), gap {:.3e}",
                     res.iterations, res.elapsed_seconds, res.gap);
        break;
      case AssignmentStatus::MaxIterations:
        spdlog::info("Assignment did not converge: iteration limit {} reached after {:.5f} s, gap {:.3e}",
                     opts_->max_iterations, res.elapsed_seconds, res.gap);
        break;
      case AssignmentStatus::MaxTime:
        spdlog::info("Assignment did not converge: time limit {:.1f} s reached after {} iterations, gap {:.3e}",
                     opts_->max_time_seconds, res.iterations, res.gap);
        break;
    }
    spdlog::info("Total system travel time: {:.6f}", res.total_system_travel_time);
  }
  return res;
}

} // namespace trafficeq::core
