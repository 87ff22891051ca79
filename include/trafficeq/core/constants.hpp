/* Numeric constants shared by cost functions and solvers. */
#pragma once

#include <limits>

#include "trafficeq/core/types.hpp"

namespace trafficeq::core {

// Links with capacity below this are treated as closed.
inline constexpr Cap kClosedLinkCapacity = 1e-3;

// Sentinel cost for closed or saturated links. Largest finite float so sums
// over many sentinel links stay finite in double precision.
inline constexpr Cost kMaxCost = static_cast<Cost>(std::numeric_limits<float>::max());

// Upper clamp for the conjugate Frank-Wolfe coefficient.
inline constexpr double kConjugateBetaMax = 1.0 - 1e-9;

// GP-E falls back to this step when the exact search returns zero.
inline constexpr double kMinExactStep = 1e-2;

} // namespace trafficeq::core
