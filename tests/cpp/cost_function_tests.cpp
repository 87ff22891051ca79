#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "trafficeq/core/constants.hpp"
#include "trafficeq/core/cost_functions.hpp"
#include "test_utils.hpp"

using namespace trafficeq::core;
using namespace trafficeq::core::test;

namespace {

Link make_link(Cost fft, Cap capacity, double length, double speed) {
  LinkSpec s = bpr_link(0, 1, fft, capacity);
  s.length = length;
  s.speed_limit = speed;
  return Link(s);
}

// Central differences of cost against derivative, and of integral against cost.
void expect_consistent(const CostModel& model, const Link& l, Flow flow) {
  const double h = 1e-4 * std::max(1.0, flow);
  const double d_num = (model.cost(l, flow + h) - model.cost(l, flow - h)) / (2.0 * h);
  EXPECT_NEAR(model.derivative(l, flow), d_num, 1e-5 * std::max(1.0, std::abs(d_num)))
      << "derivative at flow " << flow;
  const double i_num = (model.integral(l, flow + h) - model.integral(l, flow - h)) / (2.0 * h);
  const double c = model.cost(l, flow);
  EXPECT_NEAR(c, i_num, 1e-5 * std::max(1.0, std::abs(c))) << "integral at flow " << flow;
}

} // namespace

TEST(CostFunctions, BprValues) {
  // 10 * (1 + 0.15 * 0.5^4)
  EXPECT_DOUBLE_EQ(bpr_cost(false, 10.0, 0.15, 50.0, 100.0, 4.0, 0.0, 0.0), 10.09375);
  EXPECT_DOUBLE_EQ(bpr_cost(false, 10.0, 0.15, 0.0, 100.0, 4.0, 0.0, 0.0), 10.0);
  // Marginal cost scales the congestion term by beta + 1
  EXPECT_DOUBLE_EQ(bpr_cost(true, 10.0, 0.15, 50.0, 100.0, 4.0, 0.0, 0.0), 10.46875);
  EXPECT_DOUBLE_EQ(bpr_cost_integral(false, 10.0, 0.15, 0.0, 100.0, 4.0, 0.0, 0.0), 0.0);
}

TEST(CostFunctions, ConstantValues) {
  EXPECT_DOUBLE_EQ(constant_cost(false, 5.0, 0.15, 30.0, 1.0, 4.0, 0.0, 0.0), 5.0);
  EXPECT_DOUBLE_EQ(constant_cost(true, 5.0, 0.15, 30.0, 1.0, 4.0, 0.0, 0.0), 35.0);
  EXPECT_DOUBLE_EQ(constant_cost_derivative(false, 5.0, 0.15, 30.0, 1.0, 4.0, 0.0, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(constant_cost_derivative(true, 5.0, 0.15, 30.0, 1.0, 4.0, 0.0, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(constant_cost_integral(false, 5.0, 0.15, 30.0, 1.0, 4.0, 0.0, 0.0), 150.0);
}

TEST(CostFunctions, GreenshieldsValues) {
  // length / (speed * (1 - flow / capacity)) = 2 / (4 * 0.5)
  EXPECT_DOUBLE_EQ(greenshields_cost(false, 0.0, 0.0, 50.0, 100.0, 0.0, 2.0, 4.0), 1.0);
  EXPECT_DOUBLE_EQ(greenshields_cost(false, 0.0, 0.0, 0.0, 100.0, 0.0, 2.0, 4.0), 0.5);
  // Marginal: length * c^2 / (speed * (c - v)^2)
  EXPECT_DOUBLE_EQ(greenshields_cost(true, 0.0, 0.0, 50.0, 100.0, 0.0, 2.0, 4.0), 2.0);
  EXPECT_EQ(greenshields_cost(false, 0.0, 0.0, 100.0, 100.0, 0.0, 2.0, 4.0), kMaxCost);
  EXPECT_EQ(greenshields_cost(false, 0.0, 0.0, 10.0, 100.0, 0.0, 2.0, 0.0), kMaxCost);
}

TEST(CostFunctions, GreenshieldsSlopeAtCapacity) {
  EXPECT_EQ(greenshields_cost_derivative(false, 0.0, 0.0, 100.0, 100.0, 0.0, 2.0, 4.0), kMaxCost);
  EXPECT_EQ(greenshields_cost_derivative(true, 0.0, 0.0, 150.0, 100.0, 0.0, 2.0, 4.0), kMaxCost);
  EXPECT_GT(greenshields_cost_derivative(false, 0.0, 0.0, 99.0, 100.0, 0.0, 2.0, 4.0), 0.0);
  // Closed links have no slope
  EXPECT_EQ(greenshields_cost_derivative(false, 0.0, 0.0, 10.0, 0.0, 0.0, 2.0, 4.0), 0.0);
  EXPECT_EQ(greenshields_cost_derivative(false, 0.0, 0.0, 10.0, 100.0, 0.0, 2.0, 0.0), 0.0);
}

TEST(CostFunctions, ClosedLinkCostsSentinel) {
  EXPECT_EQ(bpr_cost(false, 10.0, 0.15, 0.0, 0.0, 4.0, 0.0, 0.0), kMaxCost);
  EXPECT_EQ(bpr_cost(true, 10.0, 0.15, 5.0, 1e-4, 4.0, 0.0, 0.0), kMaxCost);
  EXPECT_EQ(bpr_cost_derivative(false, 10.0, 0.15, 5.0, 0.0, 4.0, 0.0, 0.0), 0.0);
  EXPECT_EQ(greenshields_cost(false, 0.0, 0.0, 0.0, 0.0, 0.0, 2.0, 4.0), kMaxCost);
  EXPECT_TRUE(std::isfinite(kMaxCost));
}

TEST(CostFunctions, BprDerivativeEdgeCases) {
  EXPECT_EQ(bpr_cost_derivative(false, 10.0, 0.15, 50.0, 100.0, 0.0, 0.0, 0.0), 0.0);
  EXPECT_EQ(bpr_cost_derivative(false, 10.0, 0.15, 0.0, 100.0, 0.5, 0.0, 0.0), kMaxCost);
  EXPECT_EQ(bpr_cost_derivative(false, 10.0, 0.15, 0.0, 100.0, 4.0, 0.0, 0.0), 0.0);
  // Linear BPR has a constant slope fft * alpha / capacity
  EXPECT_DOUBLE_EQ(bpr_cost_derivative(false, 10.0, 1.0, 0.0, 100.0, 1.0, 0.0, 0.0), 0.1);
  EXPECT_DOUBLE_EQ(bpr_cost_derivative(true, 10.0, 1.0, 30.0, 100.0, 1.0, 0.0, 0.0), 0.2);
}

TEST(CostFunctions, NonDecreasingAndBoundedBelowByFreeFlow) {
  const Link l = make_link(10.0, 100.0, 2.0, 4.0);
  for (auto kind : {CostFunctionKind::BPR, CostFunctionKind::Constant, CostFunctionKind::Greenshields}) {
    for (bool so : {false, true}) {
      CostModel model{kind, so};
      const Cost at_zero = model.cost(l, 0.0);
      if (kind == CostFunctionKind::Greenshields) {
        EXPECT_DOUBLE_EQ(at_zero, 0.5);
      } else {
        EXPECT_GE(at_zero, l.free_flow_time);
      }
      Cost prev = at_zero;
      for (Flow v = 5.0; v <= 200.0; v += 5.0) {
        const Cost c = model.cost(l, v);
        EXPECT_GE(c, prev) << to_string(kind) << " so=" << so << " flow=" << v;
        EXPECT_GE(model.derivative(l, v), 0.0);
        prev = c;
      }
    }
  }
}

TEST(CostFunctions, DerivativeAndIntegralAreConsistent) {
  const Link l = make_link(10.0, 100.0, 2.0, 4.0);
  for (auto kind : {CostFunctionKind::BPR, CostFunctionKind::Constant, CostFunctionKind::Greenshields}) {
    for (bool so : {false, true}) {
      CostModel model{kind, so};
      for (Flow v : {1.0, 20.0, 55.0, 80.0}) {
        SCOPED_TRACE(to_string(kind) + (so ? " SO" : " UE"));
        expect_consistent(model, l, v);
      }
    }
  }
}

TEST(CostFunctions, CostModelUsesCurrentCapacity) {
  Link l = make_link(10.0, 100.0, 0.0, 0.0);
  CostModel model{CostFunctionKind::BPR, false};
  const Cost full = model.cost(l, 50.0);
  l.modify_capacity(-0.5);
  EXPECT_GT(model.cost(l, 50.0), full);
  EXPECT_DOUBLE_EQ(model.cost(l, 50.0), 10.0 * 1.15);
  l.modify_capacity(-1.0);
  EXPECT_EQ(model.cost(l, 50.0), kMaxCost);
}

TEST(CostFunctions, TravelTimeDropsMarginalFlag) {
  CostModel so{CostFunctionKind::Greenshields, true};
  auto tt = so.travel_time();
  EXPECT_EQ(tt.kind, CostFunctionKind::Greenshields);
  EXPECT_FALSE(tt.system_optimal);
}
