#pragma once

#include <stdexcept>
#include <string>

namespace rrf {

// Unknown gamma selector, or a heuristic that produced gamma <= 0.
class ConfigurationError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// Input that a heuristic cannot work with (too few samples, a class
// without out-of-class points, ...).
class PreconditionViolation : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// transform() input whose feature count differs from the one seen by fit().
class DimensionMismatchError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// transform() called before a successful fit().
class NotFittedError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

}  // namespace rrf
