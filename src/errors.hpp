#pragma once

#include <stdexcept>
#include <string>

namespace bbpssw {

// Raised when operand shapes are incompatible (multiply, add, Bell
// transforms of anything but a 4x4 matrix, ...).
class DimensionMismatch : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

class NotSquare : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// Out-of-range channel strengths, qubit indices and matrix sizes that are
// not a power of two.
class InvalidParameter : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// Rejected SimulationParameters or orchestration requests.
class InvalidConfiguration : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

class DivisionByZero : public std::domain_error {
  public:
    using std::domain_error::domain_error;
};

}  // namespace bbpssw
