#include "sg/core/value.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/arithmetic.hpp"
#include <cmath>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace sg {

Node::~Node() {
  // Releasing the last handle of a deep chain would otherwise recurse once
  // per node. Detach uniquely owned parents onto a heap stack instead.
  std::vector<std::shared_ptr<Node>> pending = std::move(parents);
  while (!pending.empty()) {
    std::shared_ptr<Node> p = std::move(pending.back());
    pending.pop_back();
    if (p && p.use_count() == 1) {
      for (auto& q : p->parents) pending.push_back(std::move(q));
      p->parents.clear();
    }
  }
}

void Node::propagate() {
  if (op == Op::Leaf || parents.empty()) return;
  Node& a = *parents.front();
  Node& b = *parents.back();

  switch (op) {
    case Op::Add:
      a.grad += grad;
      b.grad += grad;
      break;
    case Op::Mul:
      a.grad += b.value * grad;
      b.grad += a.value * grad;
      break;
    case Op::Pow:
      a.grad += exponent * std::pow(a.value, exponent - 1.0) * grad;
      break;
    case Op::Exp:
      a.grad += value * grad;
      break;
    case Op::Tanh:
      a.grad += (1.0 - value * value) * grad;
      break;
    case Op::Relu:
      a.grad += (value > 0.0 ? 1.0 : 0.0) * grad;
      break;
    case Op::Leaf:
      break;
  }
}

std::string op_tag(const Node& n) {
  switch (n.op) {
    case Op::Leaf: return "";
    case Op::Add:  return "+";
    case Op::Mul:  return "*";
    case Op::Pow: {
      std::ostringstream oss;
      oss << "**" << n.exponent;
      return oss.str();
    }
    case Op::Exp:  return "exp";
    case Op::Tanh: return "tanh";
    case Op::Relu: return "ReLU";
  }
  return "";
}

Value::Value() : n(std::make_shared<Node>()) {}

Value::Value(double value, std::string label) : n(std::make_shared<Node>()) {
  n->value = value;
  n->label = std::move(label);
}

Value::Value(std::shared_ptr<Node> node) : n(std::move(node)) {
  if (!n) throw std::invalid_argument("Value: null node");
}

double Value::value() const { return n->value; }
double Value::grad()  const { return n->grad;  }
std::string Value::op() const { return op_tag(*n); }
const std::string& Value::label() const { return n->label; }

Value& Value::set_label(std::string label) {
  n->label = std::move(label);
  return *this;
}

std::vector<Value> Value::parents() const {
  std::vector<Value> out;
  out.reserve(n->parents.size());
  for (auto& p : n->parents) out.emplace_back(p);
  return out;
}

bool Value::is_leaf() const { return n->op == Op::Leaf; }

void Value::set_value(double v) {
  if (!is_leaf()) throw std::logic_error("set_value: only leaf nodes can be overwritten");
  n->value = v;
}

void Value::zero_grad() { n->grad = 0.0; }
void Value::backward() { sg::backward(*this); }

Value Value::exp()  const { return expv(*this); }
Value Value::tanh() const { return tanhv(*this); }
Value Value::relu() const { return sg::relu(*this); }
Value Value::abs()  const { return absv(*this); }
Value Value::pow(double exponent) const { return sg::pow(*this, exponent); }

Value as_value(const Operand& x) {
  if (x.is_node()) return Value(x.node());
  return Value(x.value());
}

std::vector<Value> values(const std::vector<double>& xs) {
  std::vector<Value> out;
  out.reserve(xs.size());
  for (double x : xs) out.emplace_back(x);
  return out;
}

Value make_from_op(double value, Op op,
                   std::initializer_list<std::shared_ptr<Node>> operands,
                   double exponent) {
  auto out = std::make_shared<Node>();
  out->value = value;
  out->op = op;
  out->exponent = exponent;
  for (auto& p : operands) {
    bool dup = false;
    for (auto& q : out->parents) if (q.get() == p.get()) { dup = true; break; }
    if (!dup) out->parents.push_back(p);
  }
  return Value(std::move(out));
}

std::vector<std::shared_ptr<Node>> topological_order(const Value& root) {
  struct Frame {
    std::shared_ptr<Node> node;
    std::size_t next;   // index of the next parent to visit
  };

  std::vector<std::shared_ptr<Node>> order;
  std::unordered_set<const Node*> seen;
  std::vector<Frame> stack;

  seen.insert(root.n.get());
  stack.push_back({root.n, 0});
  while (!stack.empty()) {
    Frame& top = stack.back();
    if (top.next < top.node->parents.size()) {
      std::shared_ptr<Node> p = top.node->parents[top.next++];
      if (p && seen.insert(p.get()).second) stack.push_back({std::move(p), 0});
    } else {
      order.push_back(std::move(top.node));
      stack.pop_back();
    }
  }
  return order;
}

void backward(const Value& root) {
  auto order = topological_order(root);
  root.n->grad = 1.0;
  for (auto it = order.rbegin(); it != order.rend(); ++it) (*it)->propagate();
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
  return os << v.label() << ": Value(data=" << v.value() << ", grad=" << v.grad() << ")";
}

} // namespace sg
