#include "sg/nn/layer.hpp"
#include "sg/core/errors.hpp"
#include <stdexcept>
#include <utility>

namespace sg::nn {

Layer::Layer(std::size_t in_features, std::size_t out_features, RNG& rng)
: in_features_(in_features) {
  if (in_features == 0 || out_features == 0)
    throw std::invalid_argument("Layer: widths must be > 0");
  neurons_.reserve(out_features);
  for (std::size_t i = 0; i < out_features; ++i)
    neurons_.push_back(std::make_shared<Neuron>(in_features, rng));
  register_neurons_();
}

Layer::Layer(std::vector<std::shared_ptr<Neuron>> neurons) : neurons_(std::move(neurons)) {
  if (neurons_.empty()) throw std::invalid_argument("Layer: needs at least one neuron");
  for (auto& n : neurons_) {
    if (!n) throw std::invalid_argument("Layer: null neuron");
  }
  in_features_ = neurons_.front()->in_features();
  for (auto& n : neurons_) {
    if (n->in_features() != in_features_)
      throw DimensionMismatch("Layer: neuron input width", in_features_, n->in_features());
  }
  register_neurons_();
}

void Layer::register_neurons_() {
  for (std::size_t i = 0; i < neurons_.size(); ++i)
    register_module("neurons." + std::to_string(i), neurons_[i]);
}

std::vector<Value> Layer::forward(const std::vector<Value>& x) {
  if (x.size() != in_features_) throw DimensionMismatch("Layer", in_features_, x.size());
  std::vector<Value> out;
  out.reserve(neurons_.size());
  for (auto& n : neurons_) out.push_back(n->activate(x));
  return out;
}

Value Layer::output(const std::vector<Value>& x) {
  if (neurons_.size() != 1) throw DimensionMismatch("Layer::output", 1, neurons_.size());
  return forward(x).front();
}

std::string Layer::repr() const {
  std::string s = "Layer of [";
  for (std::size_t i = 0; i < neurons_.size(); ++i) {
    if (i) s += ", ";
    s += neurons_[i]->repr();
  }
  return s + "]";
}

} // namespace sg::nn
