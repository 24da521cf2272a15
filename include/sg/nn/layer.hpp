#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sg/core/rng.hpp"
#include "sg/nn/module.hpp"
#include "sg/nn/neuron.hpp"

namespace sg::nn {

// A dense layer: out_features neurons applied to the same input.
class Layer : public Module {
public:
  Layer(std::size_t in_features, std::size_t out_features, RNG& rng = global_rng());

  // All neurons must have the same input width.
  explicit Layer(std::vector<std::shared_ptr<Neuron>> neurons);

  // One output node per neuron, in neuron order.
  std::vector<Value> forward(const std::vector<Value>& x) override;

  // Bare node for a single-neuron layer; DimensionMismatch otherwise.
  Value output(const std::vector<Value>& x);

  std::size_t in_features()  const { return in_features_; }
  std::size_t out_features() const { return neurons_.size(); }
  const std::vector<std::shared_ptr<Neuron>>& neurons() const { return neurons_; }

  std::string repr() const override;

private:
  void register_neurons_();

  std::size_t in_features_ = 0;
  std::vector<std::shared_ptr<Neuron>> neurons_;
};

} // namespace sg::nn
