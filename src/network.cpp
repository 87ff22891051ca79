/*
  TransportNetwork: validated road network with deterministic adjacency.

  Construction checks ids and parameters, drops empty and self-referential
  demand, derives zones and the origin set, and compacts outgoing links into
  CSR form keeping link insertion order within each source node.
*/
#include "trafficeq/core/network.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "trafficeq/core/error.hpp"

namespace trafficeq::core {

Link::Link(const LinkSpec& spec)
    : from(spec.from), to(spec.to), max_capacity(spec.capacity), length(spec.length),
      free_flow_time(spec.free_flow_time), alpha(spec.alpha), beta(spec.beta),
      speed_limit(spec.speed_limit), toll(spec.toll), link_type(spec.link_type),
      capacity_percentage(1.0), capacity(spec.capacity), flow(0.0), cost(spec.free_flow_time) {}

void Link::modify_capacity(double delta) {
  if (!(delta >= -1.0 && delta <= 1.0)) {
    throw ValueError("capacity delta must be within [-1, 1]");
  }
  capacity_percentage = std::clamp(capacity_percentage + delta, 0.0, 1.0);
  capacity = max_capacity * capacity_percentage;
}

void Link::reset() noexcept {
  capacity_percentage = 1.0;
  capacity = max_capacity;
  reset_flow();
}

void Link::reset_flow() noexcept {
  flow = 0.0;
  cost = free_flow_time;
}

TransportNetwork TransportNetwork::from_parts(
    std::int32_t num_nodes,
    std::span<const LinkSpec> links,
    std::span<const Demand> demand) {

  if (num_nodes < 0) {
    throw ValueError("num_nodes must be >= 0");
  }
  auto in_range = [num_nodes](NodeId v) { return v >= 0 && v < num_nodes; };

  TransportNetwork net;
  net.nodes_.resize(static_cast<std::size_t>(num_nodes));
  for (std::int32_t v = 0; v < num_nodes; ++v) net.nodes_[static_cast<std::size_t>(v)].id = v;

  // Links: invariants are ids within [0, num_nodes), non-negative finite
  // parameters, and at most one link per (from, to).
  net.links_.reserve(links.size());
  for (const auto& spec : links) {
    if (!in_range(spec.from) || !in_range(spec.to)) {
      throw ValueError("link endpoint out of range of num_nodes");
    }
    if (!(spec.capacity >= 0.0) || !(spec.free_flow_time >= 0.0) || !(spec.length >= 0.0)) {
      throw ValueError("link capacity, free_flow_time and length must be >= 0");
    }
    if (!(spec.alpha >= 0.0) || !(spec.beta >= 0.0) || !std::isfinite(spec.alpha) || !std::isfinite(spec.beta)) {
      throw ValueError("link alpha and beta must be finite and >= 0");
    }
    const LinkKey key{spec.from, spec.to};
    const auto id = static_cast<LinkId>(net.links_.size());
    if (!net.link_index_.emplace(key, id).second) {
      throw ValueError("duplicate link (" + std::to_string(spec.from) + ", " + std::to_string(spec.to) + ")");
    }
    net.links_.emplace_back(spec);
    auto& u = net.nodes_[static_cast<std::size_t>(spec.from)];
    auto& v = net.nodes_[static_cast<std::size_t>(spec.to)];
    u.out_nodes.push_back(spec.to);
    v.in_nodes.push_back(spec.from);
  }

  // Build CSR adjacency (counting sort keeps insertion order per source)
  const std::size_t m = net.links_.size();
  net.row_offsets_.assign(static_cast<std::size_t>(num_nodes) + 1, 0);
  for (const auto& l : net.links_) {
    net.row_offsets_[static_cast<std::size_t>(l.from) + 1]++;
  }
  for (std::size_t i = 1; i < net.row_offsets_.size(); ++i) {
    net.row_offsets_[i] += net.row_offsets_[i - 1];
  }
  net.out_links_.resize(m);
  std::vector<std::int32_t> cursor = net.row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = net.links_[e].from;
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    net.out_links_[pos] = static_cast<LinkId>(e);
  }

  // Demand and zones
  auto zone_for = [&net](NodeId id) -> Zone& {
    auto [it, inserted] = net.zone_index_.emplace(id, net.zones_.size());
    if (inserted) net.zones_.push_back(Zone{id, {}});
    return net.zones_[it->second];
  };
  for (const auto& d : demand) {
    if (!in_range(d.origin) || !in_range(d.destination)) {
      throw ValueError("demand endpoint out of range of num_nodes");
    }
    if (!(d.volume >= 0.0) || !std::isfinite(d.volume)) {
      throw ValueError("demand volume must be finite and >= 0");
    }
    if (d.origin == d.destination || d.volume == 0.0) continue;
    const ODKey key{d.origin, d.destination};
    if (!net.demand_index_.emplace(key, d.volume).second) {
      throw ValueError("duplicate demand (" + std::to_string(d.origin) + ", " + std::to_string(d.destination) + ")");
    }
    net.demands_.push_back(d);
    zone_for(d.origin).destinations.push_back(d.destination);
    (void)zone_for(d.destination);
    net.origins_.push_back(d.origin);
  }
  std::sort(net.origins_.begin(), net.origins_.end());
  net.origins_.erase(std::unique(net.origins_.begin(), net.origins_.end()), net.origins_.end());
  return net;
}

std::optional<LinkId> TransportNetwork::find_link(NodeId from, NodeId to) const noexcept {
  auto it = link_index_.find(LinkKey{from, to});
  if (it == link_index_.end()) return std::nullopt;
  return it->second;
}

const Zone& TransportNetwork::zone(NodeId id) const {
  auto it = zone_index_.find(id);
  if (it == zone_index_.end()) {
    throw ValueError("node " + std::to_string(id) + " is not a zone");
  }
  return zones_[it->second];
}

Flow TransportNetwork::demand(NodeId origin, NodeId destination) const noexcept {
  auto it = demand_index_.find(ODKey{origin, destination});
  return it == demand_index_.end() ? 0.0 : it->second;
}

Flow TransportNetwork::total_demand() const noexcept {
  Flow total = 0.0;
  for (const auto& d : demands_) total += d.volume;
  return total;
}

void TransportNetwork::modify_capacity(LinkId id, double delta) {
  if (id < 0 || id >= num_links()) {
    throw ValueError("link id out of range");
  }
  links_[static_cast<std::size_t>(id)].modify_capacity(delta);
}

void TransportNetwork::reset() noexcept {
  for (auto& l : links_) l.reset();
}

void TransportNetwork::reset_flow() noexcept {
  for (auto& l : links_) l.reset_flow();
}

} // namespace trafficeq::core
