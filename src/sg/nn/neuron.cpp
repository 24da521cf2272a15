#include "sg/nn/neuron.hpp"
#include "sg/core/errors.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/arithmetic.hpp"
#include <stdexcept>
#include <utility>

namespace sg::nn {

Neuron::Neuron(std::size_t in_features, RNG& rng) {
  if (in_features == 0) throw std::invalid_argument("Neuron: in_features must be > 0");
  w_.reserve(in_features);
  for (std::size_t i = 0; i < in_features; ++i) w_.emplace_back(rng.uniform(-1.0, 1.0));
  b_ = Value(rng.uniform(-1.0, 1.0));
  register_params_();
}

Neuron::Neuron(std::vector<Value> weights, Value bias)
: w_(std::move(weights)), b_(std::move(bias)) {
  if (w_.empty()) throw std::invalid_argument("Neuron: needs at least one weight");
  register_params_();
}

void Neuron::register_params_() {
  for (std::size_t i = 0; i < w_.size(); ++i) register_parameter("w." + std::to_string(i), w_[i]);
  register_parameter("b", b_);
}

Value Neuron::activate(const std::vector<Value>& x) const {
  if (x.size() != w_.size()) throw DimensionMismatch("Neuron", w_.size(), x.size());
  // accumulate onto the bias: ((b + w0*x0) + w1*x1) + ...
  Value act = b_;
  for (std::size_t i = 0; i < w_.size(); ++i) act = act + w_[i] * x[i];
  return tanhv(act);
}

std::string Neuron::repr() const {
  return "Neuron(" + std::to_string(w_.size()) + ")";
}

} // namespace sg::nn
