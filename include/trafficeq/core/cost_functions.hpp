/*
  Volume-delay functions: cost, derivative d(cost)/d(flow), and integral of
  cost from 0 to flow.

  Every function takes the same argument list so callers can switch between
  them. When `optimal` is true the marginal-cost (system-optimal) variant is
  returned. Closed links (capacity < kClosedLinkCapacity) cost kMaxCost.
*/
#pragma once

#include "trafficeq/core/network.hpp"
#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

[[nodiscard]] Cost bpr_cost(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                            double beta, double length, double speed_limit) noexcept;
[[nodiscard]] Cost bpr_cost_derivative(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                                       double beta, double length, double speed_limit) noexcept;
[[nodiscard]] Cost bpr_cost_integral(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                                     double beta, double length, double speed_limit) noexcept;

[[nodiscard]] Cost constant_cost(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                                 double beta, double length, double speed_limit) noexcept;
[[nodiscard]] Cost constant_cost_derivative(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                                            double beta, double length, double speed_limit) noexcept;
[[nodiscard]] Cost constant_cost_integral(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                                          double beta, double length, double speed_limit) noexcept;

// Greenshields ignores fft/alpha/beta; free-flow time is length / speed_limit.
// Flow at or above capacity, or a non-positive speed limit, costs kMaxCost.
// The derivative is kMaxCost at or above capacity and 0 on a closed link.
[[nodiscard]] Cost greenshields_cost(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                                     double beta, double length, double speed_limit) noexcept;
[[nodiscard]] Cost greenshields_cost_derivative(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                                                double beta, double length, double speed_limit) noexcept;
[[nodiscard]] Cost greenshields_cost_integral(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                                              double beta, double length, double speed_limit) noexcept;

// CostModel binds a function family and the UE/SO flag, and evaluates it
// against a link's parameters and current capacity.
struct CostModel {
  CostFunctionKind kind { CostFunctionKind::BPR };
  bool system_optimal { false };

  [[nodiscard]] Cost cost(const Link& link, Flow flow) const noexcept;
  [[nodiscard]] Cost derivative(const Link& link, Flow flow) const noexcept;
  [[nodiscard]] Cost integral(const Link& link, Flow flow) const noexcept;

  // Same function family evaluated as plain user travel time.
  [[nodiscard]] CostModel travel_time() const noexcept { return CostModel{kind, false}; }
};

} // namespace trafficeq::core
