#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sg/core/rng.hpp"
#include "sg/nn/module.hpp"

namespace sg::nn {

// out = tanh(b + sum_i w_i * x_i)
// Parameters: w (one per input, registered as "w.<i>") then b.
class Neuron : public Module {
public:
  // Weights and bias drawn independently from U(-1, 1).
  explicit Neuron(std::size_t in_features, RNG& rng = global_rng());

  // Adopt existing parameter nodes; lets several neurons share a weight.
  Neuron(std::vector<Value> weights, Value bias);

  // Single output node. Throws DimensionMismatch if x.size() != in_features().
  Value activate(const std::vector<Value>& x) const;

  std::vector<Value> forward(const std::vector<Value>& x) override { return {activate(x)}; }

  std::size_t in_features() const { return w_.size(); }
  const std::vector<Value>& weights() const { return w_; }
  const Value& bias() const { return b_; }

  std::string repr() const override;

private:
  void register_params_();

  std::vector<Value> w_;
  Value b_;
};

} // namespace sg::nn
