/* TransportNetwork: nodes, links, zones and OD demand with mutable link state. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Static description of one directed link, as handed over by a loader.
// Defaults follow the usual BPR calibration (alpha=0.15, beta=4).
struct LinkSpec {
  NodeId from { -1 };
  NodeId to { -1 };
  Cap capacity { 0.0 };
  double length { 0.0 };
  Cost free_flow_time { 0.0 };
  double alpha { 0.15 };
  double beta { 4.0 };
  double speed_limit { 0.0 };
  double toll { 0.0 };
  std::int32_t link_type { 1 };
};

// One OD demand entry.
struct Demand {
  NodeId origin { -1 };
  NodeId destination { -1 };
  Flow volume { 0.0 };
};

struct Node {
  NodeId id { -1 };
  std::vector<NodeId> out_nodes;
  std::vector<NodeId> in_nodes;
};

// Link carries static parameters plus the mutable capacity/flow/cost state
// the solvers operate on. cost is only ever written by a CostModel refresh
// (see loading.hpp) or reset to free_flow_time by reset()/reset_flow().
struct Link {
  NodeId from { -1 };
  NodeId to { -1 };
  Cap max_capacity { 0.0 };
  double length { 0.0 };
  Cost free_flow_time { 0.0 };
  double alpha { 0.15 };
  double beta { 4.0 };
  double speed_limit { 0.0 };
  double toll { 0.0 };
  std::int32_t link_type { 1 };

  double capacity_percentage { 1.0 };
  Cap capacity { 0.0 };
  Flow flow { 0.0 };
  Cost cost { 0.0 };

  Link() = default;
  explicit Link(const LinkSpec& spec);

  // Scenario modifier: shift the capacity percentage by delta (in [-1, 1]),
  // clamped to [0, 1].
  void modify_capacity(double delta);
  void reset() noexcept;
  void reset_flow() noexcept;
};

struct Zone {
  NodeId id { -1 };
  std::vector<NodeId> destinations;  // positive demand only; fixed after build
};

class TransportNetwork {
public:
  // Validates inputs and builds adjacency. Demand entries with zero volume or
  // origin == destination are dropped. Throws ValueError on out-of-range ids,
  // negative parameters or volumes, and duplicate link or OD keys.
  [[nodiscard]] static TransportNetwork from_parts(
      std::int32_t num_nodes,
      std::span<const LinkSpec> links,
      std::span<const Demand> demand);
  ~TransportNetwork() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(nodes_.size()); }
  [[nodiscard]] std::int32_t num_links() const noexcept { return static_cast<std::int32_t>(links_.size()); }

  [[nodiscard]] std::span<const Node> nodes() const noexcept { return nodes_; }
  [[nodiscard]] std::span<const Link> links() const noexcept { return links_; }
  [[nodiscard]] std::span<Link> links() noexcept { return links_; }
  [[nodiscard]] const Link& link(LinkId id) const { return links_.at(static_cast<std::size_t>(id)); }
  [[nodiscard]] Link& link(LinkId id) { return links_.at(static_cast<std::size_t>(id)); }
  [[nodiscard]] std::optional<LinkId> find_link(NodeId from, NodeId to) const noexcept;

  // Outgoing adjacency in CSR form: links leaving u are
  // out_links_view()[row_offsets_view()[u] .. row_offsets_view()[u+1]).
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const LinkId> out_links_view() const noexcept { return out_links_; }

  [[nodiscard]] std::span<const Zone> zones() const noexcept { return zones_; }
  [[nodiscard]] const Zone& zone(NodeId id) const;
  // Sorted unique origins of the retained demand.
  [[nodiscard]] std::span<const NodeId> origins() const noexcept { return origins_; }
  [[nodiscard]] std::span<const Demand> demands() const noexcept { return demands_; }
  // Demand volume for (origin, destination); 0 when absent.
  [[nodiscard]] Flow demand(NodeId origin, NodeId destination) const noexcept;
  [[nodiscard]] Flow total_demand() const noexcept;

  void modify_capacity(LinkId id, double delta);
  // Restore capacities and clear flows.
  void reset() noexcept;
  // Clear flows, keep capacities.
  void reset_flow() noexcept;

private:
  std::vector<Node> nodes_ {};
  std::vector<Link> links_ {};
  std::unordered_map<LinkKey, LinkId, LinkKeyHash> link_index_ {};

  // CSR adjacency, stable in link insertion order for deterministic traversal
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<LinkId> out_links_ {};

  std::vector<Zone> zones_ {};
  std::unordered_map<NodeId, std::size_t> zone_index_ {};
  std::vector<NodeId> origins_ {};
  std::vector<Demand> demands_ {};
  std::unordered_map<ODKey, Flow, LinkKeyHash> demand_index_ {};
};

} // namespace trafficeq::core
