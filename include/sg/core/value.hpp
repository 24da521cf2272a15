#pragma once
#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace sg {

// Which local derivative rule a node applies when its gradient is pushed back.
enum class Op { Leaf, Add, Mul, Pow, Exp, Tanh, Relu };

struct Node {
  double value = 0.0;
  double grad  = 0.0;

  // Distinct operands in argument order. Binary rules read the left operand
  // from front() and the right one from back(), so `x*x` keeps x once here
  // and still receives both contributions.
  std::vector<std::shared_ptr<Node>> parents;

  Op op = Op::Leaf;
  double exponent = 0.0;   // Op::Pow only
  std::string label;       // diagnostics

  Node() = default;
  ~Node();                 // non-recursive teardown of long chains

  Node(const Node&)            = delete;
  Node& operator=(const Node&) = delete;

  // Accumulate this node's grad into its parents (no-op for leaves).
  void propagate();
};

// "+", "*", "**2", "exp", "tanh", "ReLU"; empty for leaves.
std::string op_tag(const Node& n);

class Value {
public:
  Value();                                              // leaf 0.0
  explicit Value(double value, std::string label = ""); // leaf
  explicit Value(std::shared_ptr<Node> node);           // wrap existing

  double value() const;
  double grad()  const;
  std::string op() const;
  const std::string& label() const;
  Value& set_label(std::string label);

  std::vector<Value> parents() const;
  bool is_leaf() const;

  // Overwrite the value of a leaf (optimizer update of a parameter).
  // Derived nodes are immutable; throws std::logic_error for them.
  void set_value(double v);

  void zero_grad();   // this node only
  void backward();    // seed 1 at this node, propagate to every ancestor

  Value exp()  const;
  Value tanh() const;
  Value relu() const;
  Value abs()  const;
  Value pow(double exponent) const;

  // node handle, shared with every downstream node that consumed it
  std::shared_ptr<Node> n;
};

// Either a raw number or a graph node. Every operation takes its arguments
// as Operands and normalizes them with as_value() before doing anything else.
class Operand {
public:
  Operand(double x) : scalar_(x) {}
  Operand(const Value& v) : node_(v.n) {}

  bool is_node() const { return static_cast<bool>(node_); }
  double value() const { return node_ ? node_->value : scalar_; }
  const std::shared_ptr<Node>& node() const { return node_; }

private:
  double scalar_ = 0.0;
  std::shared_ptr<Node> node_;
};

// Node operands pass through; raw numbers become fresh leaves.
Value as_value(const Operand& x);

// Raw inputs -> leaf nodes.
std::vector<Value> values(const std::vector<double>& xs);

// Build the node produced by an operation. Operands are de-duplicated by
// identity; value, op and exponent are fixed here and never change.
Value make_from_op(double value, Op op,
                   std::initializer_list<std::shared_ptr<Node>> operands,
                   double exponent = 0.0);

// Post-order over `parents` reachable from root: every node comes after all
// of its operands, root last. Iterative, keyed by node address.
std::vector<std::shared_ptr<Node>> topological_order(const Value& root);

// Reverse-mode pass. Sets root.grad = 1 and runs propagate() from the root
// down to the leaves. Gradients are accumulated, never reset here.
void backward(const Value& root);

std::ostream& operator<<(std::ostream& os, const Value& v);

} // namespace sg
