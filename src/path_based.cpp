/*
  GradientProjectionSolver: path-based equilibrium by gradient projection.

  Each OD pair keeps every route ever found shortest. Per iteration, flow is
  moved off every non-shortest route along a Newton-like direction
  (cost excess / second derivative over the links the two routes do not
  share) and the current shortest route absorbs the remainder of the
  demand, so route flows of a pair always sum to its demand.

  GP uses a fixed step; GP-E picks the step by a bisection on the derivative
  of the Beckmann objective along the combined shift of all OD pairs.
*/
#include "trafficeq/core/path_based.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include "trafficeq/core/constants.hpp"
#include "trafficeq/core/error.hpp"
#include "trafficeq/core/line_search.hpp"
#include "trafficeq/core/loading.hpp"
#include "trafficeq/core/shortest_paths.hpp"

namespace trafficeq::core {

namespace {
// Route flow after a step of size a along direction d.
Flow shifted_flow(Flow f, double d, double a) noexcept {
  if (d == 0.0) return f;
  if (std::isinf(d)) return 0.0;
  return std::max(0.0, f - a * d);
}

Cost route_cost(const std::vector<LinkId>& route_links, const std::vector<Cost>& link_cost) noexcept {
  Cost c = 0.0;
  for (LinkId e : route_links) c += link_cost[static_cast<std::size_t>(e)];
  return c;
}
} // namespace

Flow RouteSet::total_flow() const noexcept {
  Flow s = 0.0;
  for (const auto& r : routes) s += r.flow;
  return s;
}

std::vector<Route> shortest_routes(const TransportNetwork& net) {
  std::vector<Route> out;
  out.reserve(net.demands().size());
  for (NodeId r : net.origins()) {
    const auto tree = shortest_paths(net, r);
    for (NodeId s : net.zone(r).destinations) {
      Route route;
      route.origin = r;
      route.destination = s;
      if (tree.reachable(s)) {
        route.links = trace_route(tree, s);
        route.cost = tree.labels[static_cast<std::size_t>(s)];
      }
      out.push_back(std::move(route));
    }
  }
  return out;
}

Cost second_derivative(const TransportNetwork& net, const CostModel& model,
                       const Route& route, const Route& shortest) {
  std::vector<LinkId> a = route.links;
  std::vector<LinkId> b = shortest.links;
  std::sort(a.begin(), a.end());
  std::sort(b.begin(), b.end());
  std::vector<LinkId> differing;
  std::set_symmetric_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(differing));
  Cost h = 0.0;
  for (LinkId e : differing) {
    const Link& l = net.link(e);
    h += model.derivative(l, l.flow);
  }
  return h;
}

double route_step_direction(const TransportNetwork& net, const CostModel& model,
                            const Route& route, const Route& shortest) {
  if (route.links == shortest.links) return 0.0;
  const Cost h = second_derivative(net, model, route, shortest);
  if (h == 0.0) return std::numeric_limits<double>::infinity();
  return std::max(0.0, route.cost - shortest.cost) / h;
}

GradientProjectionSolver::GradientProjectionSolver(Algorithm algorithm, CostModel model,
                                                   double step_size, LineSearchOptions line_search)
    : algorithm_(algorithm), model_(model), step_size_(step_size), line_search_(line_search) {
  if (algorithm != Algorithm::GradientProjection && algorithm != Algorithm::GradientProjectionExact) {
    throw AlgorithmError("GradientProjectionSolver: algorithm must be GP or GP-E, got " + to_string(algorithm));
  }
  if (!(step_size > 0.0 && step_size <= 1.0)) {
    throw ValueError("GradientProjectionSolver: step_size must be within (0, 1]");
  }
}

void GradientProjectionSolver::start(TransportNetwork& net) {
  net.reset_flow();
  update_link_costs(net, model_);
  route_sets_.clear();
  for (NodeId r : net.origins()) {
    for (NodeId s : net.zone(r).destinations) {
      route_sets_.push_back(RouteSet{r, s, net.demand(r, s), {}});
    }
  }
}

double GradientProjectionSolver::step(TransportNetwork& net, std::int32_t iteration) {
  auto shortest = shortest_routes(net);
  if (shortest.size() != route_sets_.size()) {
    throw ValueError("GradientProjectionSolver: network demand changed since start()");
  }

  double alpha = 1.0;
  if (iteration == 1) {
    for (std::size_t i = 0; i < route_sets_.size(); ++i) {
      if (!std::isfinite(shortest[i].cost)) continue;
      shortest[i].flow = route_sets_[i].demand;
      route_sets_[i].routes.push_back(std::move(shortest[i]));
    }
  } else {
    const auto plan = plan_shift(net, shortest);
    alpha = (algorithm_ == Algorithm::GradientProjectionExact) ? exact_step(net, plan, shortest) : step_size_;
    apply_shift(plan, shortest, alpha);
  }

  load_route_flows(net);
  update_link_costs(net, model_);
  update_route_costs(net);
  return alpha;
}

GradientProjectionSolver::ShiftPlan GradientProjectionSolver::plan_shift(
    const TransportNetwork& net, const std::vector<Route>& shortest) const {
  ShiftPlan plan;
  plan.directions.resize(route_sets_.size());
  plan.shortest_index.assign(route_sets_.size(), -1);
  for (std::size_t i = 0; i < route_sets_.size(); ++i) {
    const auto& routes = route_sets_[i].routes;
    plan.directions[i].assign(routes.size(), 0.0);
    if (!std::isfinite(shortest[i].cost)) continue;
    for (std::size_t j = 0; j < routes.size(); ++j) {
      if (plan.shortest_index[i] < 0 && routes[j].links == shortest[i].links) {
        plan.shortest_index[i] = static_cast<std::int32_t>(j);
        continue;
      }
      plan.directions[i][j] = route_step_direction(net, model_, routes[j], shortest[i]);
    }
  }
  return plan;
}

double GradientProjectionSolver::exact_step(const TransportNetwork& net, const ShiftPlan& plan,
                                            const std::vector<Route>& shortest) const {
  const auto links = net.links();
  std::vector<Flow> x(links.size());
  std::vector<Cost> c(links.size());

  auto derivative = [&](double a) {
    std::fill(x.begin(), x.end(), 0.0);
    for (std::size_t i = 0; i < route_sets_.size(); ++i) {
      if (!std::isfinite(shortest[i].cost)) continue;
      const auto& routes = route_sets_[i].routes;
      Flow others = 0.0;
      for (std::size_t j = 0; j < routes.size(); ++j) {
        if (static_cast<std::int32_t>(j) == plan.shortest_index[i]) continue;
        const Flow f = shifted_flow(routes[j].flow, plan.directions[i][j], a);
        others += f;
        for (LinkId e : routes[j].links) x[static_cast<std::size_t>(e)] += f;
      }
      const Flow absorbed = std::max(0.0, route_sets_[i].demand - others);
      for (LinkId e : shortest[i].links) x[static_cast<std::size_t>(e)] += absorbed;
    }
    for (std::size_t k = 0; k < links.size(); ++k) c[k] = model_.cost(links[k], x[k]);

    // d/da of sum(integral cost) = sum over active routes of d * (C_shortest - C_route)
    double g = 0.0;
    for (std::size_t i = 0; i < route_sets_.size(); ++i) {
      if (!std::isfinite(shortest[i].cost)) continue;
      const auto& routes = route_sets_[i].routes;
      const Cost c_short = route_cost(shortest[i].links, c);
      for (std::size_t j = 0; j < routes.size(); ++j) {
        const double d = plan.directions[i][j];
        if (d == 0.0 || std::isinf(d)) continue;
        if (routes[j].flow - a * d <= 0.0) continue;
        g += d * (c_short - route_cost(routes[j].links, c));
      }
    }
    return g;
  };

  const double alpha = std::clamp(bisection_line_search(derivative, line_search_), 0.0, 1.0);
  return alpha == 0.0 ? kMinExactStep : alpha;
}

void GradientProjectionSolver::apply_shift(const ShiftPlan& plan, std::vector<Route>& shortest, double alpha) {
  for (std::size_t i = 0; i < route_sets_.size(); ++i) {
    if (!std::isfinite(shortest[i].cost)) continue;
    auto& set = route_sets_[i];
    const std::int32_t idx = plan.shortest_index[i];
    Flow others = 0.0;
    for (std::size_t j = 0; j < set.routes.size(); ++j) {
      if (static_cast<std::int32_t>(j) == idx) continue;
      set.routes[j].flow = shifted_flow(set.routes[j].flow, plan.directions[i][j], alpha);
      others += set.routes[j].flow;
    }
    const Flow absorbed = std::max(0.0, set.demand - others);
    if (idx >= 0) {
      set.routes[static_cast<std::size_t>(idx)].flow = absorbed;
    } else {
      shortest[i].flow = absorbed;
      set.routes.push_back(std::move(shortest[i]));
    }
  }
}

void GradientProjectionSolver::load_route_flows(TransportNetwork& net) const {
  auto links = net.links();
  for (auto& l : links) l.flow = 0.0;
  for (const auto& set : route_sets_) {
    for (const auto& r : set.routes) {
      for (LinkId e : r.links) links[static_cast<std::size_t>(e)].flow += r.flow;
    }
  }
}

void GradientProjectionSolver::update_route_costs(const TransportNetwork& net) {
  for (auto& set : route_sets_) {
    for (auto& r : set.routes) {
      r.cost = 0.0;
      for (LinkId e : r.links) r.cost += net.link(e).cost;
    }
  }
}

} // namespace trafficeq::core
