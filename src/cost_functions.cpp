/*
  Cost functions: BPR, constant and Greenshields volume-delay functions.

  Derivatives and integrals are the closed forms of the exact cost
  expressions (including the system-optimal variants), so line searches and
  Newton-type steps see a consistent objective.
*/
#include "trafficeq/core/cost_functions.hpp"

#include <cmath>

#include "trafficeq/core/constants.hpp"

namespace trafficeq::core {

Cost bpr_cost(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
              double beta, double /*length*/, double /*speed_limit*/) noexcept {
  if (capacity < kClosedLinkCapacity) return kMaxCost;
  const double ratio_pow = std::pow(flow / capacity, beta);
  if (optimal) {
    return fft * (1.0 + alpha * ratio_pow * (beta + 1.0));
  }
  return fft * (1.0 + alpha * ratio_pow);
}

Cost bpr_cost_derivative(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                         double beta, double /*length*/, double /*speed_limit*/) noexcept {
  if (capacity < kClosedLinkCapacity) return 0.0;
  if (beta == 0.0) return 0.0;
  // (v/c)^(beta-1) is unbounded at v=0 for beta<1
  if (flow <= 0.0 && beta < 1.0) return kMaxCost;
  const double d = fft * alpha * beta * std::pow(flow / capacity, beta - 1.0) / capacity;
  return optimal ? d * (beta + 1.0) : d;
}

Cost bpr_cost_integral(bool optimal, Cost fft, double alpha, Flow flow, Cap capacity,
                       double beta, double /*length*/, double /*speed_limit*/) noexcept {
  if (capacity < kClosedLinkCapacity) return kMaxCost * flow;
  const double ratio_pow = std::pow(flow / capacity, beta);
  if (optimal) {
    return fft * (flow + alpha * flow * ratio_pow);
  }
  return fft * (flow + alpha * flow * ratio_pow / (1.0 + beta));
}

Cost constant_cost(bool optimal, Cost fft, double /*alpha*/, Flow flow, Cap /*capacity*/,
                   double /*beta*/, double /*length*/, double /*speed_limit*/) noexcept {
  return optimal ? fft + flow : fft;
}

Cost constant_cost_derivative(bool optimal, Cost /*fft*/, double /*alpha*/, Flow /*flow*/, Cap /*capacity*/,
                              double /*beta*/, double /*length*/, double /*speed_limit*/) noexcept {
  return optimal ? 1.0 : 0.0;
}

Cost constant_cost_integral(bool optimal, Cost fft, double /*alpha*/, Flow flow, Cap /*capacity*/,
                            double /*beta*/, double /*length*/, double /*speed_limit*/) noexcept {
  return optimal ? fft * flow + 0.5 * flow * flow : fft * flow;
}

namespace {
bool greenshields_closed(Cap capacity, double speed_limit) noexcept {
  return capacity < kClosedLinkCapacity || speed_limit <= 0.0;
}

bool greenshields_saturated(Flow flow, Cap capacity, double speed_limit) noexcept {
  return greenshields_closed(capacity, speed_limit) || flow >= capacity;
}
} // namespace

Cost greenshields_cost(bool optimal, Cost /*fft*/, double /*alpha*/, Flow flow, Cap capacity,
                       double /*beta*/, double length, double speed_limit) noexcept {
  if (greenshields_saturated(flow, capacity, speed_limit)) return kMaxCost;
  if (optimal) {
    const double headroom = capacity - flow;
    return (length * capacity * capacity) / (speed_limit * headroom * headroom);
  }
  return length / (speed_limit * (1.0 - flow / capacity));
}

Cost greenshields_cost_derivative(bool optimal, Cost /*fft*/, double /*alpha*/, Flow flow, Cap capacity,
                                  double /*beta*/, double length, double speed_limit) noexcept {
  if (greenshields_closed(capacity, speed_limit)) return 0.0;
  // Saturated: steep but finite slope
  if (flow >= capacity) return kMaxCost;
  const double headroom = capacity - flow;
  if (optimal) {
    return 2.0 * length * capacity * capacity / (speed_limit * headroom * headroom * headroom);
  }
  return length * capacity / (speed_limit * headroom * headroom);
}

Cost greenshields_cost_integral(bool optimal, Cost /*fft*/, double /*alpha*/, Flow flow, Cap capacity,
                                double /*beta*/, double length, double speed_limit) noexcept {
  if (greenshields_saturated(flow, capacity, speed_limit)) return kMaxCost * flow;
  if (optimal) {
    return length * capacity * flow / (speed_limit * (capacity - flow));
  }
  return -(length * capacity / speed_limit) * std::log1p(-flow / capacity);
}

Cost CostModel::cost(const Link& l, Flow flow) const noexcept {
  switch (kind) {
    case CostFunctionKind::Constant:
      return constant_cost(system_optimal, l.free_flow_time, l.alpha, flow, l.capacity, l.beta, l.length, l.speed_limit);
    case CostFunctionKind::Greenshields:
      return greenshields_cost(system_optimal, l.free_flow_time, l.alpha, flow, l.capacity, l.beta, l.length, l.speed_limit);
    case CostFunctionKind::BPR:
    default:
      return bpr_cost(system_optimal, l.free_flow_time, l.alpha, flow, l.capacity, l.beta, l.length, l.speed_limit);
  }
}

Cost CostModel::derivative(const Link& l, Flow flow) const noexcept {
  switch (kind) {
    case CostFunctionKind::Constant:
      return constant_cost_derivative(system_optimal, l.free_flow_time, l.alpha, flow, l.capacity, l.beta, l.length, l.speed_limit);
    case CostFunctionKind::Greenshields:
      return greenshields_cost_derivative(system_optimal, l.free_flow_time, l.alpha, flow, l.capacity, l.beta, l.length, l.speed_limit);
    case CostFunctionKind::BPR:
    default:
      return bpr_cost_derivative(system_optimal, l.free_flow_time, l.alpha, flow, l.capacity, l.beta, l.length, l.speed_limit);
  }
}

Cost CostModel::integral(const Link& l, Flow flow) const noexcept {
  switch (kind) {
    case CostFunctionKind::Constant:
      return constant_cost_integral(system_optimal, l.free_flow_time, l.alpha, flow, l.capacity, l.beta, l.length, l.speed_limit);
    case CostFunctionKind::Greenshields:
      return greenshields_cost_integral(system_optimal, l.free_flow_time, l.alpha, flow, l.capacity, l.beta, l.length, l.speed_limit);
    case CostFunctionKind::BPR:
    default:
      return bpr_cost_integral(system_optimal, l.free_flow_time, l.alpha, flow, l.capacity, l.beta, l.length, l.speed_limit);
  }
}

} // namespace trafficeq::core
