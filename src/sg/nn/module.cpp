// ============================
// File: src/sg/nn/module.cpp
// ============================
#include "sg/nn/module.hpp"
#include <ostream>
#include <stdexcept>
#include <unordered_set>

namespace sg::nn {

std::vector<Value> Module::parameters() const {
  std::vector<Value> out;
  out.reserve(16);

  for (auto& [name, p] : params_) out.push_back(p);

  for (auto& [name, child] : children_) {
    auto child_params = child->parameters();
    out.insert(out.end(), child_params.begin(), child_params.end());
  }

  // Order-preserving dedup by node identity (a shared weight is listed once)
  std::vector<Value> deduped;
  deduped.reserve(out.size());
  std::unordered_set<const Node*> seen;
  seen.reserve(out.size());
  for (auto& p : out) {
    if (seen.insert(p.n.get()).second) deduped.push_back(p);
  }
  return deduped;
}

std::vector<std::pair<std::string, Value>> Module::named_parameters(const std::string& prefix) const {
  std::vector<std::pair<std::string, Value>> out;

  for (auto& [name, p] : params_) {
    std::string full = prefix.empty() ? name : (prefix + "." + name);
    out.emplace_back(full, p);
  }

  for (auto& [cname, child] : children_) {
    std::string child_prefix = prefix.empty() ? cname : (prefix + "." + cname);
    auto child_named = child->named_parameters(child_prefix);
    out.insert(out.end(), child_named.begin(), child_named.end());
  }

  return out;
}

void Module::zero_grad() {
  for (auto& p : parameters()) p.zero_grad();
}

std::shared_ptr<Module> Module::register_module(const std::string& name, std::shared_ptr<Module> m) {
  if (!m) throw std::invalid_argument("register_module: null module '" + name + "'");
  children_.emplace_back(name, m);
  return m;
}

Module& Module::register_parameter(const std::string& name, const Value& v) {
  params_.emplace_back(name, v);
  return *this;
}

std::ostream& operator<<(std::ostream& os, const Module& m) {
  return os << m.repr();
}

} // namespace sg::nn
