#pragma once
#include "sg/core/value.hpp"

namespace sg {

// Unary nodes. Suffixed names avoid clashing with std::exp/std::tanh/std::abs.
Value expv(const Operand& x);
Value tanhv(const Operand& x);   // (e^2x - 1) / (e^2x + 1)
Value relu(const Operand& x);

// -x for negative values, otherwise x itself (no new node).
Value absv(const Operand& x);

} // namespace sg
