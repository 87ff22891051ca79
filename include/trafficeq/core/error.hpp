#pragma once

#include <stdexcept>
#include <string>

namespace trafficeq::core {

// Invalid network data or option values.
struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Unknown algorithm or cost-function selection. Raised before solving starts.
struct AlgorithmError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace trafficeq::core
