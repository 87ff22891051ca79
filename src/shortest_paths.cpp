/*
  shortest_paths: Dijkstra over a TransportNetwork.

  Labels are relaxed only on a strictly shorter path and equal heap keys pop
  in node id order, so equal-cost alternatives resolve the same way on every
  run. Stale heap entries are skipped instead of decreased in place.
*/
#include "trafficeq/core/shortest_paths.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <utility>

#include "trafficeq/core/error.hpp"

namespace trafficeq::core {

bool ShortestPathTree::reachable(NodeId v) const noexcept {
  if (v < 0 || static_cast<std::size_t>(v) >= labels.size()) return false;
  return std::isfinite(labels[static_cast<std::size_t>(v)]);
}

ShortestPathTree shortest_paths(const TransportNetwork& net, NodeId src) {
  const auto N = net.num_nodes();
  if (src < 0 || src >= N) {
    throw ValueError("shortest_paths: source out of range");
  }
  const auto row = net.row_offsets_view();
  const auto adj = net.out_links_view();
  const auto links = net.links();

  ShortestPathTree tree;
  tree.source = src;
  tree.labels.assign(static_cast<std::size_t>(N), std::numeric_limits<Cost>::infinity());
  tree.pred_node.assign(static_cast<std::size_t>(N), -1);
  tree.pred_link.assign(static_cast<std::size_t>(N), -1);
  tree.labels[static_cast<std::size_t>(src)] = 0.0;

  using QItem = std::pair<Cost, NodeId>;
  auto cmp = [](const QItem& a, const QItem& b) {
    return a.first > b.first || (a.first == b.first && a.second > b.second);
  };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  pq.emplace(0.0, src);

  while (!pq.empty()) {
    auto [d_u, u] = pq.top(); pq.pop();
    if (d_u > tree.labels[static_cast<std::size_t>(u)]) continue;
    auto start = static_cast<std::size_t>(row[static_cast<std::size_t>(u)]);
    auto end   = static_cast<std::size_t>(row[static_cast<std::size_t>(u) + 1]);
    for (std::size_t i = start; i < end; ++i) {
      const LinkId e = adj[i];
      const Link& l = links[static_cast<std::size_t>(e)];
      const Cost nd = d_u + l.cost;
      auto vi = static_cast<std::size_t>(l.to);
      if (nd < tree.labels[vi]) {
        tree.labels[vi] = nd;
        tree.pred_node[vi] = u;
        tree.pred_link[vi] = e;
        pq.emplace(nd, l.to);
      }
    }
  }
  return tree;
}

std::vector<LinkId> trace_route(const ShortestPathTree& tree, NodeId dst) {
  std::vector<LinkId> links_rev;
  if (!tree.reachable(dst)) return links_rev;
  for (NodeId v = dst; v != tree.source; v = tree.pred_node[static_cast<std::size_t>(v)]) {
    links_rev.push_back(tree.pred_link[static_cast<std::size_t>(v)]);
  }
  std::reverse(links_rev.begin(), links_rev.end());
  return links_rev;
}

} // namespace trafficeq::core
