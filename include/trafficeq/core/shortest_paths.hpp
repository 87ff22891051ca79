/* Shortest paths (Dijkstra) over current link costs with route reconstruction. */
#pragma once

#include <vector>

#include "trafficeq/core/network.hpp"
#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Per-source scratch state of one Dijkstra run. Every call starts from a
// fresh tree: labels at +inf, no predecessors, source label 0. Unreachable
// nodes keep label +inf and pred_node/pred_link == -1.
struct ShortestPathTree {
  NodeId source { -1 };
  std::vector<Cost> labels;
  std::vector<NodeId> pred_node;
  std::vector<LinkId> pred_link;

  [[nodiscard]] bool reachable(NodeId v) const noexcept;
};

// Single-source, all-destination shortest paths using Link::cost as weights.
// Costs must be non-negative (guaranteed by the cost functions).
// Throws ValueError if src is out of range.
[[nodiscard]] ShortestPathTree shortest_paths(const TransportNetwork& net, NodeId src);

// Walk predecessors from dst back to the tree source and return the
// traversed links in forward order. Empty when dst is the source or is
// unreachable.
[[nodiscard]] std::vector<LinkId> trace_route(const ShortestPathTree& tree, NodeId dst);

} // namespace trafficeq::core
