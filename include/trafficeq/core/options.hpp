/* Option structs for line searches and assignment runs. */
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

struct IterationRecord;

// Bisection on a directional derivative over alpha in [0, 1].
struct LineSearchOptions {
  double tolerance { 1e-12 };       // stop when the alpha bracket is narrower
  std::int32_t max_iterations { 100 };
};

struct AssignmentOptions {
  Algorithm algorithm { Algorithm::FrankWolfe };
  CostFunctionKind cost_function { CostFunctionKind::BPR };
  // Route on marginal cost (system optimum) instead of average cost (UE).
  bool system_optimal { false };
  double accuracy { 1e-4 };          // relative gap threshold
  std::int32_t max_iterations { 1000 };
  double max_time_seconds { 60.0 };
  double step_size { 0.05 };         // fixed alpha for GP
  bool verbose { true };
  LineSearchOptions line_search {};
  // Called once per iteration after the gap is measured.
  std::function<void(const IterationRecord&)> on_iteration {};
};

// Throws ValueError on out-of-range values.
void validate(const AssignmentOptions& opts);

// Case-insensitive. Throws AlgorithmError for unknown names.
[[nodiscard]] Algorithm parse_algorithm(std::string_view name);
[[nodiscard]] CostFunctionKind parse_cost_function(std::string_view name);

[[nodiscard]] std::string to_string(Algorithm a);
[[nodiscard]] std::string to_string(CostFunctionKind k);
[[nodiscard]] std::string to_string(AssignmentStatus s);

[[nodiscard]] bool is_path_based(Algorithm a) noexcept;

} // namespace trafficeq::core
