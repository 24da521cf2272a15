#include "sg/ops/arithmetic.hpp"
#include "sg/core/errors.hpp"
#include <cmath>

namespace sg {

Value add(const Operand& a, const Operand& b) {
  const Value x = as_value(a), y = as_value(b);
  return make_from_op(x.value() + y.value(), Op::Add, {x.n, y.n});
}

Value mul(const Operand& a, const Operand& b) {
  const Value x = as_value(a), y = as_value(b);
  return make_from_op(x.value() * y.value(), Op::Mul, {x.n, y.n});
}

Value pow(const Operand& base, const Operand& exponent) {
  if (exponent.is_node()) throw InvalidExponentType();
  const Value x = as_value(base);
  const double k = exponent.value();
  // 0 ** -1 and friends give inf/nan like plain floating point
  return make_from_op(std::pow(x.value(), k), Op::Pow, {x.n}, k);
}

Value neg(const Operand& a) { return mul(a, -1.0); }
Value sub(const Operand& a, const Operand& b) { return add(a, neg(b)); }
Value div(const Operand& a, const Operand& b) { return mul(a, pow(b, -1.0)); }

Value operator+(const Operand& a, const Operand& b) { return add(a, b); }
Value operator-(const Operand& a, const Operand& b) { return sub(a, b); }
Value operator*(const Operand& a, const Operand& b) { return mul(a, b); }
Value operator/(const Operand& a, const Operand& b) { return div(a, b); }
Value operator-(const Value& a) { return neg(a); }

bool operator>(const Operand& a, const Operand& b) { return a.value() > b.value(); }
bool operator<(const Operand& a, const Operand& b) { return a.value() < b.value(); }

} // namespace sg
