#include <cmath>
#include <exception>
#include <string>
#include <vector>

#include "scalarnet.hpp"
#include "tests/helpers.hpp"

using namespace scalarnet;

static void test_leaf_defaults() {
    TEST_HEADER("fresh values are leaves with zero gradient");
    Value v(3.5);
    EXPECT_TRUE(v.initialized(), "constructed value is initialized");
    EXPECT_TRUE(v.is_leaf(), "constructed value is a leaf");
    EXPECT_CLOSE(v.data(), 3.5, 1e-12, "data");
    EXPECT_CLOSE(v.grad(), 0.0, 1e-12, "grad starts at 0");
    EXPECT_TRUE(!Value().initialized(), "default handle is uninitialized");
}

static void test_arithmetic_forward() {
    TEST_HEADER("arithmetic forward values");
    Value a(2.0), b(-3.0);
    EXPECT_CLOSE((a + b).data(), -1.0, 1e-12, "a+b");
    EXPECT_CLOSE((a - b).data(), 5.0, 1e-12, "a-b");
    EXPECT_CLOSE((a * b).data(), -6.0, 1e-12, "a*b");
    EXPECT_CLOSE((a / b).data(), -2.0 / 3.0, 1e-12, "a/b");
    EXPECT_CLOSE((-a).data(), -2.0, 1e-12, "-a");
    EXPECT_CLOSE(a.pow(3.0).data(), 8.0, 1e-12, "a^3");
    EXPECT_CLOSE((1.0 + a).data(), 3.0, 1e-12, "1+a");
    EXPECT_CLOSE((a * 4.0).data(), 8.0, 1e-12, "a*4");
    EXPECT_CLOSE((1.0 - a).data(), -1.0, 1e-12, "1-a");
    EXPECT_CLOSE((1.0 / a).data(), 0.5, 1e-12, "1/a");
    EXPECT_TRUE(!(a + b).is_leaf(), "result of an op is not a leaf");
    EXPECT_TRUE(std::string((a * b).grad_fn()->name()) == "*", "records the producing op");
    EXPECT_TRUE(a.grad_fn() == nullptr, "leaves have no grad_fn");
}

static void test_mul_add_backward() {
    TEST_HEADER("backward through mul and add");
    Value x1(2.0), w1(-3.0), x2(0.0), w2(1.0), b(6.8813735870195432);
    Value n = x1 * w1 + x2 * w2 + b;
    Value o = tanh(n);
    o.backward();

    const double t = std::tanh(n.data());
    const double dn = 1.0 - t * t;
    EXPECT_CLOSE(o.data(), t, 1e-12, "tanh forward");
    EXPECT_CLOSE(n.grad(), dn, 1e-12, "dn");
    EXPECT_CLOSE(b.grad(), dn, 1e-12, "db");
    EXPECT_CLOSE(x1.grad(), w1.data() * dn, 1e-12, "dx1");
    EXPECT_CLOSE(w1.grad(), x1.data() * dn, 1e-12, "dw1");
    EXPECT_CLOSE(x2.grad(), w2.data() * dn, 1e-12, "dx2");
    EXPECT_CLOSE(w2.grad(), 0.0, 1e-12, "dw2");
}

static void test_shared_node_accumulates() {
    TEST_HEADER("gradients from several paths are summed");
    Value a(3.0);
    Value b = a + a;
    b.backward();
    EXPECT_CLOSE(a.grad(), 2.0, 1e-12, "d(a+a)/da");

    Value x(-4.0), y(2.0);
    Value z = x * y;
    Value q = z + x;
    Value h = (z * z).relu();
    Value out = h + q + q * x;
    out.backward();
    // out = (xy)^2 + xy + x + x^2 y + x^2 with relu active since (xy)^2 > 0
    const double dx = 2.0 * x.data() * y.data() * y.data() + y.data() + 1.0 +
                      2.0 * x.data() * y.data() + 2.0 * x.data();
    const double dy = 2.0 * x.data() * x.data() * y.data() + x.data() +
                      x.data() * x.data();
    EXPECT_CLOSE(x.grad(), dx, 1e-9, "dx through shared nodes");
    EXPECT_CLOSE(y.grad(), dy, 1e-9, "dy through shared nodes");
}

static void test_relu_backward() {
    TEST_HEADER("relu passes gradient only for positive inputs");
    Value pos(1.5), neg(-0.5), zero(0.0);
    Value rp = relu(pos), rn = relu(neg), rz = relu(zero);
    EXPECT_CLOSE(rp.data(), 1.5, 1e-12, "relu(1.5)");
    EXPECT_CLOSE(rn.data(), 0.0, 1e-12, "relu(-0.5)");
    EXPECT_CLOSE(rz.data(), 0.0, 1e-12, "relu(0)");
    rp.backward();
    rn.backward();
    rz.backward();
    EXPECT_CLOSE(pos.grad(), 1.0, 1e-12, "positive grad");
    EXPECT_CLOSE(neg.grad(), 0.0, 1e-12, "negative grad");
    EXPECT_CLOSE(zero.grad(), 0.0, 1e-12, "zero grad");
}

static void test_div_pow_backward() {
    TEST_HEADER("div and pow gradients");
    Value a(3.0), b(2.0);
    Value c = a / b;
    c.backward();
    EXPECT_CLOSE(a.grad(), 0.5, 1e-12, "d(a/b)/da");
    EXPECT_CLOSE(b.grad(), -0.75, 1e-12, "d(a/b)/db");

    Value p(2.0);
    Value sq = p.pow(2.0);
    sq.backward(3.0);
    EXPECT_CLOSE(p.grad(), 12.0, 1e-12, "seeded d(p^2)/dp");
}

static void test_zero_grad_resets() {
    TEST_HEADER("zero_grad resets accumulated gradient");
    Value a(1.0), b(5.0);
    Value c = a * b;
    c.backward();
    c.backward();
    EXPECT_TRUE(a.grad() != 0.0, "gradient accumulated");
    a.zero_grad();
    EXPECT_CLOSE(a.grad(), 0.0, 0.0, "exactly zero after reset");
}

static void test_topological_order() {
    TEST_HEADER("topological order lists inputs before outputs, once each");
    Value a(1.0), b(2.0);
    Value c = a * b;
    Value d = c + a;
    auto order = topological_order(d);
    EXPECT_EQ(order.size(), size_t(4), "four distinct nodes");
    EXPECT_TRUE(order.back() == d.impl(), "root comes last");

    auto pos = [&order](const Value& v) {
        for (size_t i = 0; i < order.size(); ++i) {
            if (order[i] == v.impl()) return i;
        }
        return order.size();
    };
    EXPECT_TRUE(pos(a) < pos(c), "a before c");
    EXPECT_TRUE(pos(b) < pos(c), "b before c");
    EXPECT_TRUE(pos(c) < pos(d), "c before d");
}

static void test_handles_alias() {
    TEST_HEADER("copied handles alias one node");
    Value a(1.0);
    Value alias = a;
    alias.set_data(7.0);
    EXPECT_CLOSE(a.data(), 7.0, 1e-12, "data shared");
    alias.accumulate_grad(2.0);
    EXPECT_CLOSE(a.grad(), 2.0, 1e-12, "grad shared");
    EXPECT_TRUE(a.to_string() == "Value(data=7, grad=2)", "to_string");
}

static void test_deep_chain_release() {
    TEST_HEADER("long chains are built, differentiated and released");
    constexpr int depth = 1000000;
    Value x(1.0);
    {
        Value acc(0.0);
        for (int i = 0; i < depth; ++i) {
            acc = acc + x;
        }
        EXPECT_CLOSE(acc.data(), double(depth), 1e-6, "chain sum");
        acc.backward();
        EXPECT_CLOSE(x.grad(), double(depth), 1e-6, "gradient through the chain");
    }
    EXPECT_TRUE(x.is_leaf(), "shared leaf survives the release");
    EXPECT_CLOSE(x.data(), 1.0, 1e-12, "shared leaf keeps its data");
}

static void test_aliased_chain_release() {
    TEST_HEADER("chains whose steps reuse one handle twice are released");
    Value acc(2.0);
    for (int i = 0; i < 200000; ++i) {
        acc = (acc + acc) * 0.5;
    }
    EXPECT_CLOSE(acc.data(), 2.0, 1e-9, "value unchanged");
    acc = Value(0.0);
    EXPECT_TRUE(acc.is_leaf(), "handle rebinds after release");
}

static void test_release_keeps_held_subgraph() {
    TEST_HEADER("releasing a root keeps subgraphs that are still held");
    Value a(3.0);
    Value mid = a * 2.0;
    {
        Value acc = mid;
        for (int i = 0; i < 100000; ++i) {
            acc = acc + 1.0;
        }
        EXPECT_CLOSE(acc.data(), 100006.0, 1e-6, "chain value");
    }
    EXPECT_TRUE(mid.grad_fn() != nullptr, "held node keeps its grad_fn");
    EXPECT_EQ(mid.grad_fn()->inputs.size(), size_t(2), "held node keeps its inputs");
    mid.backward();
    EXPECT_CLOSE(a.grad(), 2.0, 1e-12, "backward still reaches the leaf");
}

int main() {
    try {
        test_leaf_defaults();
        test_arithmetic_forward();
        test_mul_add_backward();
        test_shared_node_accumulates();
        test_relu_backward();
        test_div_pow_backward();
        test_zero_grad_resets();
        test_topological_order();
        test_handles_alias();
        test_deep_chain_release();
        test_aliased_chain_release();
        test_release_keeps_held_subgraph();
        return report();
    } catch (const std::exception& e) {
        fmt::print(stderr, "\nEXCEPTION: {}\n", e.what());
        return 2;
    }
}
