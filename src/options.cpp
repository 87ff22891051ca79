#include "trafficeq/core/options.hpp"

#include <algorithm>
#include <cctype>

#include "trafficeq/core/error.hpp"

namespace trafficeq::core {

namespace {
std::string upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}
} // namespace

void validate(const AssignmentOptions& opts) {
  if (!(opts.accuracy >= 0.0)) {
    throw ValueError("accuracy must be >= 0");
  }
  if (opts.max_iterations < 1) {
    throw ValueError("max_iterations must be >= 1");
  }
  if (!(opts.max_time_seconds >= 0.0)) {
    throw ValueError("max_time_seconds must be >= 0");
  }
  if (is_path_based(opts.algorithm) && !(opts.step_size > 0.0 && opts.step_size <= 1.0)) {
    throw ValueError("step_size must be within (0, 1]");
  }
  if (!(opts.line_search.tolerance > 0.0) || opts.line_search.max_iterations < 1) {
    throw ValueError("line_search tolerance must be > 0 and max_iterations >= 1");
  }
}

Algorithm parse_algorithm(std::string_view name) {
  const auto n = upper(name);
  if (n == "MSA") return Algorithm::MSA;
  if (n == "FW") return Algorithm::FrankWolfe;
  if (n == "CFW") return Algorithm::ConjugateFrankWolfe;
  if (n == "GP") return Algorithm::GradientProjection;
  if (n == "GP-E") return Algorithm::GradientProjectionExact;
  throw AlgorithmError("unknown algorithm '" + std::string(name) + "': expected MSA, FW, CFW, GP or GP-E");
}

CostFunctionKind parse_cost_function(std::string_view name) {
  const auto n = upper(name);
  if (n == "BPR") return CostFunctionKind::BPR;
  if (n == "CONSTANT") return CostFunctionKind::Constant;
  if (n == "GREENSHIELDS") return CostFunctionKind::Greenshields;
  throw AlgorithmError("unknown cost function '" + std::string(name) + "': expected BPR, constant or greenshields");
}

std::string to_string(Algorithm a) {
  switch (a) {
    case Algorithm::MSA: return "MSA";
    case Algorithm::FrankWolfe: return "FW";
    case Algorithm::ConjugateFrankWolfe: return "CFW";
    case Algorithm::GradientProjection: return "GP";
    case Algorithm::GradientProjectionExact: return "GP-E";
  }
  return "unknown";
}

std::string to_string(CostFunctionKind k) {
  switch (k) {
    case CostFunctionKind::BPR: return "BPR";
    case CostFunctionKind::Constant: return "constant";
    case CostFunctionKind::Greenshields: return "greenshields";
  }
  return "unknown";
}

std::string to_string(AssignmentStatus s) {
  switch (s) {
    case AssignmentStatus::Converged: return "converged";
    case AssignmentStatus::MaxIterations: return "max_iterations";
    case AssignmentStatus::MaxTime: return "max_time";
  }
  return "unknown";
}

bool is_path_based(Algorithm a) noexcept {
  return a == Algorithm::GradientProjection || a == Algorithm::GradientProjectionExact;
}

} // namespace trafficeq::core
