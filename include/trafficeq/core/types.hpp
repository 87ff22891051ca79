/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId/LinkId: int32 (matches np.int32)
 * - Cost/Cap/Flow: double (matches np.float64)
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <functional>

namespace trafficeq::core {

// Node and link identifiers are signed 32-bit integers. Nodes are dense in
// [0, num_nodes); links are numbered in insertion order.
using NodeId = std::int32_t;
using LinkId = std::int32_t;
using Cost   = double;  // Travel time (or marginal travel time under SO)
using Cap    = double;  // Link capacity (veh/h)
using Flow   = double;  // Flow volume (same unit as capacity)

// LinkKey identifies a link by its ordered endpoint pair.
struct LinkKey {
  NodeId from;
  NodeId to;
  friend bool operator==(const LinkKey& a, const LinkKey& b) noexcept {
    return a.from == b.from && a.to == b.to;
  }
};

// ODKey identifies a demand entry by (origin, destination).
using ODKey = LinkKey;

// Hash function for LinkKey (enables use in std::unordered_map).
struct LinkKeyHash {
  std::size_t operator()(const LinkKey& k) const noexcept {
    std::size_t h = 0;
    auto combine = [&h](std::size_t v) {
      h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    combine(std::hash<NodeId>{}(k.from));
    combine(std::hash<NodeId>{}(k.to));
    return h;
  }
};

// Volume-delay function used to turn link flow into link cost.
enum class CostFunctionKind {
  BPR = 1,          // Bureau of Public Roads: fft * (1 + alpha * (v/c)^beta)
  Constant = 2,     // Flow-independent free-flow time
  Greenshields = 3  // Linear speed-density model
};

// Equilibrium-seeking algorithm.
enum class Algorithm {
  MSA = 1,                     // Method of successive averages
  FrankWolfe = 2,              // FW with exact line search
  ConjugateFrankWolfe = 3,     // CFW: conjugate direction + FW line search
  GradientProjection = 4,      // Path-based GP with fixed step
  GradientProjectionExact = 5  // Path-based GP with exact line search
};

// Outcome of an assignment run. Only Converged means gap <= accuracy.
enum class AssignmentStatus {
  Converged = 1,
  MaxIterations = 2,
  MaxTime = 3
};

} // namespace trafficeq::core
