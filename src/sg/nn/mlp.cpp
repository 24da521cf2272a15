#include "sg/nn/mlp.hpp"
#include "sg/core/errors.hpp"
#include <stdexcept>

namespace sg::nn {

MLP::MLP(std::size_t in_features, const std::vector<std::size_t>& out_widths, RNG& rng) {
  if (out_widths.empty()) throw std::invalid_argument("MLP: needs at least one layer");
  std::vector<std::size_t> sz;
  sz.reserve(out_widths.size() + 1);
  sz.push_back(in_features);
  sz.insert(sz.end(), out_widths.begin(), out_widths.end());

  layers_.reserve(out_widths.size());
  for (std::size_t i = 0; i + 1 < sz.size(); ++i) {
    layers_.push_back(std::make_shared<Layer>(sz[i], sz[i + 1], rng));
    register_module("layers." + std::to_string(i), layers_.back());
  }
}

std::vector<Value> MLP::forward(const std::vector<Value>& x) {
  if (x.size() != in_features()) throw DimensionMismatch("MLP", in_features(), x.size());
  std::vector<Value> y = x;
  for (auto& layer : layers_) y = layer->forward(y);
  return y;
}

Value MLP::output(const std::vector<Value>& x) {
  if (out_features() != 1) throw DimensionMismatch("MLP::output", 1, out_features());
  return forward(x).front();
}

std::string MLP::repr() const {
  std::string s = "MLP of [";
  for (std::size_t i = 0; i < layers_.size(); ++i) {
    if (i) s += ", ";
    s += layers_[i]->repr();
  }
  return s + "]";
}

} // namespace sg::nn
