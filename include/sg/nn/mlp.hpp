#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sg/core/rng.hpp"
#include "sg/nn/layer.hpp"
#include "sg/nn/module.hpp"

namespace sg::nn {

// Multilayer perceptron: layer i maps widths sz[i] -> sz[i+1], where
// sz = {in_features, out_widths...}. Output of one layer feeds the next.
//
//   MLP net(3, {4, 4, 1});
//   Value y = net.output(std::vector<double>{1.0, 2.0, 3.0});
//   net.zero_grad();
//   y.backward();
class MLP : public Module {
public:
  MLP(std::size_t in_features, const std::vector<std::size_t>& out_widths,
      RNG& rng = global_rng());

  std::vector<Value> forward(const std::vector<Value>& x) override;

  // Bare output node when the last layer has width 1; DimensionMismatch otherwise.
  Value output(const std::vector<Value>& x);
  Value output(const std::vector<double>& x) { return output(values(x)); }

  std::size_t in_features() const { return layers_.front()->in_features(); }
  std::size_t out_features() const { return layers_.back()->out_features(); }
  const std::vector<std::shared_ptr<Layer>>& layers() const { return layers_; }

  std::string repr() const override;

private:
  std::vector<std::shared_ptr<Layer>> layers_;
};

} // namespace sg::nn
