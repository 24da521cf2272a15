// ============================
// File: include/sg/nn/module.hpp
// ============================
#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sg/core/value.hpp"

namespace sg::nn {

// Base class for the network composition layer.
// - Pure-virtual forward() over a sequence of scalar nodes
// - Parameter registration + recursive collection in registration order
// - Named children/params ("layers.0.neurons.1.w.2")
// - zero_grad()
//
// Notes:
// * Copy/move are deleted; children are held by shared_ptr and registered once.
// * parameters() order is part of the public contract: own params in
//   registration order (weights before bias), then each child in turn.
class Module {
public:
  Module() = default;
  virtual ~Module() = default;

  Module(const Module&)            = delete;
  Module& operator=(const Module&) = delete;
  Module(Module&&)                 = delete;
  Module& operator=(Module&&)      = delete;

  // Core forward API (pure graph construction, no gradients computed)
  virtual std::vector<Value> forward(const std::vector<Value>& x) = 0;

  std::vector<Value> operator()(const std::vector<Value>& x) { return forward(x); }
  std::vector<Value> operator()(const std::vector<double>& x) { return forward(values(x)); }

  // Parameter utilities
  std::vector<Value> parameters() const;
  std::vector<std::pair<std::string, Value>> named_parameters(const std::string& prefix = "") const;
  void zero_grad();

  // Short human-readable description, e.g. "Neuron(3)".
  virtual std::string repr() const = 0;

  // Hierarchy (children)
  std::shared_ptr<Module> register_module(const std::string& name, std::shared_ptr<Module> m);
  Module& register_parameter(const std::string& name, const Value& v);

  const std::vector<std::pair<std::string, std::shared_ptr<Module>>>& children() const {
    return children_;
  }

private:
  std::vector<std::pair<std::string, std::shared_ptr<Module>>> children_;
  std::vector<std::pair<std::string, Value>> params_;
};

std::ostream& operator<<(std::ostream& os, const Module& m);

} // namespace sg::nn
