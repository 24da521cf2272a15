// tests/test_value_basic.cpp
#include "test_framework.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "sg/core/value.hpp"
#include "sg/ops/arithmetic.hpp"
#include "sg/ops/activations.hpp"

using sg::Value;

TEST("value/leaf_defaults") {
    Value x(3.5, "x");
    ASSERT_NEAR(x.value(), 3.5, 0.0);
    ASSERT_NEAR(x.grad(), 0.0, 0.0);
    ASSERT_TRUE(x.is_leaf());
    ASSERT_TRUE(x.parents().empty());
    ASSERT_TRUE(x.op().empty());
    ASSERT_TRUE(x.label() == "x");

    Value z;
    ASSERT_NEAR(z.value(), 0.0, 0.0);
    ASSERT_TRUE(z.is_leaf());
}

TEST("value/add_same_node_accumulates") {
    // y = x + x -> dy/dx = 2
    Value x(1.5);
    Value y = x + x;
    ASSERT_NEAR(y.value(), 3.0, 1e-15);
    ASSERT_TRUE(y.parents().size() == 1);   // operand set holds x once
    y.backward();
    ASSERT_NEAR(x.grad(), 2.0, 1e-15);
}

TEST("value/product_rule") {
    Value a(3.0), b(4.0);
    Value y = a * b;
    ASSERT_NEAR(y.value(), 12.0, 1e-15);
    y.backward();
    ASSERT_NEAR(a.grad(), 4.0, 1e-15);
    ASSERT_NEAR(b.grad(), 3.0, 1e-15);
}

TEST("value/square_via_mul_same_node") {
    // y = x * x -> dy/dx = 2x
    Value x(-2.5);
    Value y = x * x;
    y.backward();
    ASSERT_NEAR(y.value(), 6.25, 1e-15);
    ASSERT_NEAR(x.grad(), -5.0, 1e-15);
}

TEST("value/tanh_at_zero") {
    Value x(0.0);
    Value y = x.tanh();
    y.backward();
    ASSERT_NEAR(y.value(), 0.0, 0.0);
    ASSERT_NEAR(x.grad(), 1.0, 1e-15);
}

TEST("value/power_rule") {
    Value x(2.0);
    Value y = sg::pow(x, 3);
    y.backward();
    ASSERT_NEAR(y.value(), 8.0, 1e-15);
    ASSERT_NEAR(x.grad(), 12.0, 1e-12);
    ASSERT_TRUE(y.op() == "**3");
}

TEST("value/op_tags") {
    Value a(1.0), b(2.0);
    ASSERT_TRUE((a + b).op() == "+");
    ASSERT_TRUE((a * b).op() == "*");
    ASSERT_TRUE(a.pow(-1).op() == "**-1");
    ASSERT_TRUE(a.pow(0.5).op() == "**0.5");
    ASSERT_TRUE(a.exp().op() == "exp");
    ASSERT_TRUE(a.tanh().op() == "tanh");
    ASSERT_TRUE(a.relu().op() == "ReLU");
    // derived ops are built from the primitives
    ASSERT_TRUE((-a).op() == "*");
    ASSERT_TRUE((a - b).op() == "+");
    ASSERT_TRUE((a / b).op() == "*");
}

TEST("value/raw_numbers_become_leaves") {
    Value x(2.0);
    Value y = x + 3.0;
    ASSERT_NEAR(y.value(), 5.0, 0.0);
    auto ps = y.parents();
    ASSERT_TRUE(ps.size() == 2);
    ASSERT_TRUE(ps[0].n == x.n);
    ASSERT_TRUE(ps[1].is_leaf());
    ASSERT_NEAR(ps[1].value(), 3.0, 0.0);

    y.backward();
    ASSERT_NEAR(x.grad(), 1.0, 0.0);
    ASSERT_NEAR(ps[1].grad(), 1.0, 0.0);
}

TEST("value/reflected_operators") {
    Value x(4.0);
    Value a = 2.0 + x;
    Value b = 2.0 * x;
    Value c = 10.0 - x;
    Value d = 2.0 / x;
    ASSERT_NEAR(a.value(), 6.0, 1e-15);
    ASSERT_NEAR(b.value(), 8.0, 1e-15);
    ASSERT_NEAR(c.value(), 6.0, 1e-15);
    ASSERT_NEAR(d.value(), 0.5, 1e-15);

    c.backward();
    ASSERT_NEAR(x.grad(), -1.0, 1e-15);
    x.zero_grad();
    d.backward();
    ASSERT_NEAR(x.grad(), -2.0 / 16.0, 1e-15);
}

TEST("value/sub_and_neg") {
    Value a(5.0), b(7.0);
    Value y = a - b;
    ASSERT_NEAR(y.value(), -2.0, 1e-15);
    y.backward();
    ASSERT_NEAR(a.grad(), 1.0, 1e-15);
    ASSERT_NEAR(b.grad(), -1.0, 1e-15);

    Value c(3.0);
    Value n = -c;
    n.backward();
    ASSERT_NEAR(n.value(), -3.0, 1e-15);
    ASSERT_NEAR(c.grad(), -1.0, 1e-15);
}

TEST("value/div_quotient_rule") {
    // y = a / b -> dy/da = 1/b, dy/db = -a/b^2
    Value a(3.0), b(4.0);
    Value y = a / b;
    y.backward();
    ASSERT_NEAR(y.value(), 0.75, 1e-15);
    ASSERT_NEAR(a.grad(), 0.25, 1e-15);
    ASSERT_NEAR(b.grad(), -3.0 / 16.0, 1e-15);
}

TEST("value/comparison_leaves_graph_alone") {
    Value a(2.0), b(1.0);
    ASSERT_TRUE(a > b);
    ASSERT_FALSE(b > a);
    ASSERT_TRUE(a > 1.5);
    ASSERT_TRUE(3.0 > a);
    ASSERT_TRUE(b < a);
    ASSERT_TRUE(a.parents().empty());
    ASSERT_TRUE(b.parents().empty());
}

TEST("value/abs") {
    Value p(2.0);
    Value ap = p.abs();
    ASSERT_TRUE(ap.n == p.n);            // non-negative: same node
    Value m(-3.0);
    Value am = m.abs();
    ASSERT_NEAR(am.value(), 3.0, 1e-15);
    am.backward();
    ASSERT_NEAR(m.grad(), -1.0, 1e-15);
}

TEST("value/equal_values_distinct_identity") {
    // Two leaves carrying the same number are separate graph members.
    Value a(2.0), b(2.0);
    Value y = a * b;
    ASSERT_TRUE(y.parents().size() == 2);
    y.backward();
    ASSERT_NEAR(a.grad(), 2.0, 1e-15);
    ASSERT_NEAR(b.grad(), 2.0, 1e-15);
}

TEST("value/handles_alias_one_node") {
    Value a(1.0);
    Value alias = a;
    Value y = a * 4.0;
    y.backward();
    ASSERT_NEAR(alias.grad(), 4.0, 1e-15);
}

TEST("value/set_value_on_leaf_only") {
    Value w(0.25);
    w.set_value(-0.5);
    ASSERT_NEAR(w.value(), -0.5, 0.0);

    Value y = w * 2.0;
    ASSERT_THROWS(y.set_value(1.0), std::logic_error);
    ASSERT_NEAR(y.value(), -1.0, 0.0);
}

TEST("value/labels_and_printing") {
    Value x(2.0, "x");
    Value y = x * 3.0;
    y.set_label("y");
    y.backward();
    std::ostringstream oss;
    oss << x;
    ASSERT_TRUE(oss.str() == "x: Value(data=2, grad=3)");
    ASSERT_TRUE(y.label() == "y");
}

TEST("value/null_handle_rejected") {
    ASSERT_THROWS((void)Value(std::shared_ptr<sg::Node>{}), std::invalid_argument);
}
