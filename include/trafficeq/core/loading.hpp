/* Network loading: cost refresh and all-or-nothing assignment. */
#pragma once

#include <cstdint>
#include <vector>

#include "trafficeq/core/cost_functions.hpp"
#include "trafficeq/core/network.hpp"
#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Recompute every link's cost from its current flow and capacity.
void update_link_costs(TransportNetwork& net, const CostModel& model) noexcept;

struct AonResult {
  Cost sptt { 0.0 };                    // sum over OD pairs of demand * shortest cost
  std::vector<Flow> aux_flow;           // per link; empty unless requested
  std::int32_t unreachable_pairs { 0 }; // OD pairs with positive demand and no route
};

// All-or-nothing loading on current link costs: one shortest-path tree per
// origin, each OD demand placed entirely on its shortest route. OD pairs are
// visited by ascending origin, then in the origin zone's destination order.
// Unreachable pairs contribute neither flow nor SPTT.
[[nodiscard]] AonResult all_or_nothing(const TransportNetwork& net, bool with_aux_flow = true);

} // namespace trafficeq::core
