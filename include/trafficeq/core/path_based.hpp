/* Path-based equilibrium solver: Gradient Projection (GP, GP-E). */
#pragma once

#include <cstdint>
#include <limits>
#include <span>
#include <vector>

#include "trafficeq/core/cost_functions.hpp"
#include "trafficeq/core/network.hpp"
#include "trafficeq/core/options.hpp"
#include "trafficeq/core/solver.hpp"

namespace trafficeq::core {

// A route references network links by id; it never owns link state.
struct Route {
  NodeId origin { -1 };
  NodeId destination { -1 };
  std::vector<LinkId> links;  // forward order
  Cost cost { std::numeric_limits<Cost>::infinity() };
  Flow flow { 0.0 };
};

// All routes discovered so far for one OD pair. Routes are only appended;
// a route whose flow decays to zero stays in the set.
struct RouteSet {
  NodeId origin { -1 };
  NodeId destination { -1 };
  Flow demand { 0.0 };
  std::vector<Route> routes;

  [[nodiscard]] Flow total_flow() const noexcept;
};

// Current shortest route for every OD pair, in all_or_nothing() order.
// Unreachable pairs get an empty link list and infinite cost.
[[nodiscard]] std::vector<Route> shortest_routes(const TransportNetwork& net);

// Sum of cost derivatives over links in exactly one of the two routes.
[[nodiscard]] Cost second_derivative(const TransportNetwork& net, const CostModel& model,
                                     const Route& route, const Route& shortest);

// Flow to shift off `route` per unit step: 0 if it is the shortest route,
// +inf when second_derivative() is 0, otherwise
// max(0, route.cost - shortest.cost) / second_derivative().
[[nodiscard]] double route_step_direction(const TransportNetwork& net, const CostModel& model,
                                          const Route& route, const Route& shortest);

class GradientProjectionSolver final : public EquilibriumSolver {
public:
  // Throws AlgorithmError unless algorithm is GradientProjection or
  // GradientProjectionExact; ValueError when step_size is outside (0, 1].
  GradientProjectionSolver(Algorithm algorithm, CostModel model, double step_size = 0.05,
                           LineSearchOptions line_search = {});

  void start(TransportNetwork& net) override;
  double step(TransportNetwork& net, std::int32_t iteration) override;
  [[nodiscard]] const CostModel& cost_model() const noexcept override { return model_; }
  [[nodiscard]] Algorithm algorithm() const noexcept override { return algorithm_; }

  [[nodiscard]] std::span<const RouteSet> route_sets() const noexcept { return route_sets_; }

private:
  struct ShiftPlan {
    std::vector<std::vector<double>> directions;  // per set, per existing route
    std::vector<std::int32_t> shortest_index;     // per set; -1 => append
  };

  [[nodiscard]] ShiftPlan plan_shift(const TransportNetwork& net,
                                     const std::vector<Route>& shortest) const;
  [[nodiscard]] double exact_step(const TransportNetwork& net, const ShiftPlan& plan,
                                  const std::vector<Route>& shortest) const;
  void apply_shift(const ShiftPlan& plan, std::vector<Route>& shortest, double alpha);
  void load_route_flows(TransportNetwork& net) const;
  void update_route_costs(const TransportNetwork& net);

  Algorithm algorithm_;
  CostModel model_;
  double step_size_;
  LineSearchOptions line_search_;
  std::vector<RouteSet> route_sets_ {};
};

} // namespace trafficeq::core
