#include "sg/ops/activations.hpp"
#include "sg/ops/arithmetic.hpp"
#include <cmath>

namespace sg {

Value expv(const Operand& X) {
  const Value x = as_value(X);
  return make_from_op(std::exp(x.value()), Op::Exp, {x.n});
}

Value tanhv(const Operand& X) {
  const Value x = as_value(X);
  // Overflows to nan for large |x|, same as the closed form it mirrors.
  const double e2 = std::exp(2.0 * x.value());
  return make_from_op((e2 - 1.0) / (e2 + 1.0), Op::Tanh, {x.n});
}

Value relu(const Operand& X) {
  const Value x = as_value(X);
  return make_from_op(x.value() > 0.0 ? x.value() : 0.0, Op::Relu, {x.n});
}

Value absv(const Operand& X) {
  const Value x = as_value(X);
  return x.value() < 0.0 ? -x : x;
}

} // namespace sg
