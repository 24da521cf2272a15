#pragma once
#include "sg/core/value.hpp"

namespace sg {

// Graph-building arithmetic. Raw numbers on either side become leaf nodes.
Value add(const Operand& a, const Operand& b);
Value sub(const Operand& a, const Operand& b);   // a + (-b)
Value mul(const Operand& a, const Operand& b);
Value div(const Operand& a, const Operand& b);   // a * b**-1
Value neg(const Operand& a);                     // a * -1

// base ** exponent. The exponent must be a plain number; a node exponent
// throws InvalidExponentType right away.
Value pow(const Operand& base, const Operand& exponent);

Value operator+(const Operand& a, const Operand& b);
Value operator-(const Operand& a, const Operand& b);
Value operator*(const Operand& a, const Operand& b);
Value operator/(const Operand& a, const Operand& b);
Value operator-(const Value& a);

// Compare forward values only; the graph is untouched.
bool operator>(const Operand& a, const Operand& b);
bool operator<(const Operand& a, const Operand& b);

} // namespace sg
