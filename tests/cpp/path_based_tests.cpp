#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "trafficeq/core/assignment.hpp"
#include "trafficeq/core/constants.hpp"
#include "trafficeq/core/error.hpp"
#include "trafficeq/core/loading.hpp"
#include "trafficeq/core/path_based.hpp"
#include "test_utils.hpp"

using namespace trafficeq::core;
using namespace trafficeq::core::test;

TEST(PathBased, ShortestRoutesInDemandOrder) {
  auto net = make_diamond_network();
  auto routes = shortest_routes(net);
  ASSERT_EQ(routes.size(), 2u);
  EXPECT_EQ(routes[0].origin, 0);
  EXPECT_EQ(routes[0].links, (std::vector<LinkId>{0, 2, 4}));
  EXPECT_DOUBLE_EQ(routes[0].cost, 8.0);
  EXPECT_EQ(routes[1].origin, 1);
  EXPECT_EQ(routes[1].links, (std::vector<LinkId>{2, 4}));
  EXPECT_DOUBLE_EQ(routes[1].cost, 4.0);
}

TEST(PathBased, UnreachablePairHasEmptyInfiniteRoute) {
  auto net = make_grid_network(3, 3, 10.0);
  auto routes = shortest_routes(net);
  ASSERT_EQ(routes.size(), 2u);
  EXPECT_FALSE(routes[0].links.empty());
  EXPECT_TRUE(routes[1].links.empty());
  EXPECT_TRUE(std::isinf(routes[1].cost));
}

TEST(PathBased, StepDirection) {
  auto net = make_two_route_network();
  CostModel model{};
  net.link(1).flow = 100.0;
  net.link(2).flow = 100.0;
  update_link_costs(net, model);

  Route direct{0, 1, {0}, 10.0, 0.0};
  Route detour{0, 1, {1, 2}, 16.0, 100.0};
  // Links in exactly one route: 0, 1, 2 with slopes 0.1, 0.04, 0.04
  EXPECT_NEAR(second_derivative(net, model, detour, direct), 0.18, 1e-12);
  EXPECT_NEAR(route_step_direction(net, model, detour, direct), 6.0 / 0.18, 1e-9);
  EXPECT_EQ(route_step_direction(net, model, direct, direct), 0.0);
  // A cheaper route never receives flow from the shortest one
  EXPECT_EQ(route_step_direction(net, model, direct, detour), 0.0);

  // Zero curvature shifts the whole route
  CostModel flat{CostFunctionKind::Constant, false};
  EXPECT_EQ(second_derivative(net, flat, detour, direct), 0.0);
  EXPECT_TRUE(std::isinf(route_step_direction(net, flat, detour, direct)));
}

TEST(PathBased, FirstIterationAssignsDemandToShortestRoute) {
  auto net = make_diamond_network();
  GradientProjectionSolver solver(Algorithm::GradientProjection, CostModel{});
  solver.start(net);
  ASSERT_EQ(solver.route_sets().size(), 2u);
  EXPECT_TRUE(solver.route_sets()[0].routes.empty());
  EXPECT_DOUBLE_EQ(solver.step(net, 1), 1.0);
  for (const auto& set : solver.route_sets()) {
    ASSERT_EQ(set.routes.size(), 1u);
    EXPECT_DOUBLE_EQ(set.routes[0].flow, set.demand);
  }
  EXPECT_DOUBLE_EQ(net.link(2).flow, 150.0);
  EXPECT_DOUBLE_EQ(net.link(4).flow, 150.0);
  expect_link_flows_match_routes(net, solver.route_sets());
}

TEST(PathBased, RouteFlowsConservedEveryIteration) {
  for (auto algo : {Algorithm::GradientProjection, Algorithm::GradientProjectionExact}) {
    auto net = make_diamond_network();
    GradientProjectionSolver solver(algo, CostModel{});
    solver.start(net);
    std::vector<std::size_t> sizes(solver.route_sets().size(), 0);
    for (std::int32_t k = 1; k <= 40; ++k) {
      (void)solver.step(net, k);
      SCOPED_TRACE(to_string(algo) + " iteration " + std::to_string(k));
      expect_route_flows_conserved(solver.route_sets());
      expect_link_flows_match_routes(net, solver.route_sets());
      expect_flow_conservation(net);
      // Routes are appended, never dropped
      for (std::size_t i = 0; i < sizes.size(); ++i) {
        EXPECT_GE(solver.route_sets()[i].routes.size(), sizes[i]);
        sizes[i] = solver.route_sets()[i].routes.size();
      }
    }
    EXPECT_GE(solver.route_sets()[0].routes.size(), 2u);
  }
}

TEST(PathBased, FlatCostsMoveWholeRouteToNewShortest) {
  auto net = make_three_node_network();
  CostModel model{CostFunctionKind::Constant, false};
  GradientProjectionSolver solver(Algorithm::GradientProjection, model);
  solver.start(net);
  (void)solver.step(net, 1);
  EXPECT_DOUBLE_EQ(net.link(0).flow, 10.0);
  EXPECT_DOUBLE_EQ(net.link(2).flow, 0.0);

  // The direct link becomes the cheapest route
  net.link(2).free_flow_time = 1.0;
  update_link_costs(net, model);
  (void)solver.step(net, 2);
  const auto& set = solver.route_sets()[0];
  ASSERT_EQ(set.routes.size(), 2u);
  EXPECT_EQ(set.routes[0].flow, 0.0);
  EXPECT_DOUBLE_EQ(set.routes[1].flow, 10.0);
  EXPECT_EQ(set.routes[1].links, (std::vector<LinkId>{2}));
  EXPECT_DOUBLE_EQ(net.link(2).flow, 10.0);
  EXPECT_EQ(net.link(0).flow, 0.0);
}

TEST(PathBased, ExactStepFallsBackWhenNothingToShift) {
  auto net = make_single_link_network();
  GradientProjectionSolver solver(Algorithm::GradientProjectionExact, CostModel{});
  solver.start(net);
  EXPECT_DOUBLE_EQ(solver.step(net, 1), 1.0);
  EXPECT_DOUBLE_EQ(solver.step(net, 2), kMinExactStep);
  EXPECT_DOUBLE_EQ(net.link(0).flow, 50.0);
}

TEST(PathBased, TwoRouteEquilibrium) {
  AssignmentOptions opts;
  opts.verbose = false;
  opts.accuracy = 1e-6;
  for (auto algo : {Algorithm::GradientProjection, Algorithm::GradientProjectionExact}) {
    auto net = make_two_route_network();
    opts.algorithm = algo;
    auto res = assign(net, opts);
    EXPECT_EQ(res.status, AssignmentStatus::Converged) << to_string(algo);
    EXPECT_NEAR(net.link(0).flow, 100.0 / 3.0, 1e-3);
    EXPECT_NEAR(res.total_system_travel_time, 100.0 * 40.0 / 3.0, 1e-2);
    if (algo == Algorithm::GradientProjectionExact) EXPECT_LE(res.iterations, 5);
  }
}

TEST(PathBased, RecoversFromSaturatedGreenshieldsLinks) {
  // The first all-or-nothing load puts the full demand of 100 on the detour,
  // whose links have capacity 100. UE: 10/(1 - x1/100) == 8/(x1/100), so
  // x1 = 400/9 at cost 18.
  AssignmentOptions opts;
  opts.verbose = false;
  opts.accuracy = 1e-6;
  opts.max_iterations = 5000;
  opts.cost_function = CostFunctionKind::Greenshields;
  for (auto algo : {Algorithm::FrankWolfe, Algorithm::GradientProjection, Algorithm::GradientProjectionExact}) {
    auto net = make_two_route_network();
    opts.algorithm = algo;
    auto res = assign(net, opts);
    SCOPED_TRACE(to_string(algo));
    ASSERT_FALSE(res.trace.empty());
    EXPECT_GT(res.trace.front().tstt, 1e30);
    EXPECT_EQ(res.status, AssignmentStatus::Converged);
    EXPECT_NEAR(net.link(0).flow, 400.0 / 9.0, 1e-2);
    EXPECT_NEAR(res.total_system_travel_time, 1800.0, 0.1);
    for (const auto& l : net.links()) EXPECT_LT(l.flow, l.capacity);
  }
}

TEST(PathBased, UnreachablePairsAreSkipped) {
  auto net = make_grid_network(3, 3, 10.0);
  GradientProjectionSolver solver(Algorithm::GradientProjection, CostModel{});
  solver.start(net);
  for (std::int32_t k = 1; k <= 5; ++k) (void)solver.step(net, k);
  EXPECT_TRUE(solver.route_sets()[1].routes.empty());
  EXPECT_NEAR(solver.route_sets()[0].total_flow(), 10.0, 1e-9);
  expect_link_flows_match_routes(net, solver.route_sets());
}

TEST(PathBased, RejectsBadConfiguration) {
  EXPECT_THROW(GradientProjectionSolver(Algorithm::FrankWolfe, CostModel{}), AlgorithmError);
  EXPECT_THROW(GradientProjectionSolver(Algorithm::GradientProjection, CostModel{}, 0.0), ValueError);
  EXPECT_THROW(GradientProjectionSolver(Algorithm::GradientProjection, CostModel{}, 1.5), ValueError);
}
