#include "trafficeq/core/line_search.hpp"

namespace trafficeq::core {

double bisection_line_search(const std::function<double(double)>& derivative,
                             const LineSearchOptions& opts) {
  if (derivative(0.0) >= 0.0) return 0.0;
  if (derivative(1.0) <= 0.0) return 1.0;

  double left = 0.0;
  double right = 1.0;
  for (std::int32_t n = 0; n < opts.max_iterations && (right - left) > opts.tolerance; ++n) {
    const double mid = 0.5 * (left + right);
    if (derivative(mid) <= 0.0) {
      left = mid;
    } else {
      right = mid;
    }
  }
  return 0.5 * (left + right);
}

} // namespace trafficeq::core
