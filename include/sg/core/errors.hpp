#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sg {

// pow() was handed a node as exponent. Only numeric exponents are supported.
struct InvalidExponentType : std::invalid_argument {
  InvalidExponentType()
  : std::invalid_argument("pow: exponent must be a number, not a Value") {}
};

// Input sequence width disagrees with what a Neuron/Layer/MLP expects.
struct DimensionMismatch : std::invalid_argument {
  DimensionMismatch(const std::string& where, std::size_t expected, std::size_t got)
  : std::invalid_argument(where + ": expected width " + std::to_string(expected) +
                          ", got " + std::to_string(got)),
    expected(expected), got(got) {}

  std::size_t expected;
  std::size_t got;
};

} // namespace sg
