#include "trafficeq/core/loading.hpp"

#include "trafficeq/core/shortest_paths.hpp"

namespace trafficeq::core {

void update_link_costs(TransportNetwork& net, const CostModel& model) noexcept {
  for (auto& l : net.links()) {
    l.cost = model.cost(l, l.flow);
  }
}

AonResult all_or_nothing(const TransportNetwork& net, bool with_aux_flow) {
  AonResult res;
  if (with_aux_flow) res.aux_flow.assign(static_cast<std::size_t>(net.num_links()), 0.0);
  for (NodeId r : net.origins()) {
    const auto tree = shortest_paths(net, r);
    for (NodeId s : net.zone(r).destinations) {
      const Flow dem = net.demand(r, s);
      if (dem <= 0.0) continue;
      if (!tree.reachable(s)) { ++res.unreachable_pairs; continue; }
      res.sptt += tree.labels[static_cast<std::size_t>(s)] * dem;
      if (!with_aux_flow) continue;
      for (LinkId e : trace_route(tree, s)) {
        res.aux_flow[static_cast<std::size_t>(e)] += dem;
      }
    }
  }
  return res;
}

} // namespace trafficeq::core
