/* One-dimensional step-size search over alpha in [0, 1]. */
#pragma once

#include <functional>

#include "trafficeq/core/options.hpp"

namespace trafficeq::core {

// Minimizes a convex phi on [0, 1] given its derivative by bisection on the
// sign of the derivative. Returns 0 when phi'(0) >= 0 and 1 when
// phi'(1) <= 0; otherwise the midpoint of the final bracket, which is
// narrower than opts.tolerance unless opts.max_iterations ran out.
[[nodiscard]] double bisection_line_search(const std::function<double(double)>& derivative,
                                           const LineSearchOptions& opts);

} // namespace trafficeq::core
