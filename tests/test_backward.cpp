// tests/test_backward.cpp
#include "test_framework.hpp"
#include "dg/core/config.hpp"
#include "dg/core/function.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/numeric.hpp"
#include "dg/ops/reduce.hpp"

#include <cmath>
#include <memory>
#include <vector>

using dg::Shape;
using dg::Tensor;
using dg::Variable;

static Variable scalar(double v) { return Variable(Tensor({v}, {1})); }

TEST("backward/leaf_is_noop_beyond_seed") {
    Variable a(Tensor({1.0, 2.0, 3.0}, {3}));
    a.backward();
    ASSERT_TRUE(!a.creator());
    ASSERT_TRUE(a.has_grad());
    for (std::size_t i = 0; i < 3; ++i) ASSERT_NEAR(a.grad().data()[i], 1.0, 0);
}

TEST("backward/add_same_shape_gives_ones") {
    Variable x(Tensor({1.0, 2.0, 3.0, 4.0}, {2, 2}));
    Variable y(Tensor({5.0, 6.0, 7.0, 8.0}, {2, 2}));
    dg::add(x, y).backward();
    ASSERT_TRUE(allclose(x.grad().data(), Tensor::ones({2, 2})));
    ASSERT_TRUE(allclose(y.grad().data(), Tensor::ones({2, 2})));
}

TEST("backward/add_broadcast_reduces_to_input_shape") {
    Variable x(Tensor::ones({2, 3}));
    Variable y(Tensor({1.0, 2.0, 3.0}, {3}));
    Variable b(Tensor({4.0, 5.0}, {2, 1}));
    Variable z = x + y + b;
    z.backward();
    ASSERT_TRUE(x.grad().shape() == Shape({2, 3}));
    ASSERT_TRUE(y.grad().shape() == Shape({3}));
    ASSERT_TRUE(b.grad().shape() == Shape({2, 1}));
    ASSERT_TRUE(allclose(y.grad().data(), Tensor::full({3}, 2.0)));
    ASSERT_TRUE(allclose(b.grad().data(), Tensor::full({2, 1}, 3.0)));
}

TEST("backward/mul_broadcast_sums_scaled_gradient") {
    Variable x(Tensor({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}, {2, 3}));
    Variable w(Tensor({2.0}, {1}));
    (x * w).backward();
    ASSERT_TRUE(w.grad().shape() == Shape({1}));
    ASSERT_NEAR(w.grad().item(), 21.0, 1e-12);
    ASSERT_TRUE(allclose(x.grad().data(), Tensor::full({2, 3}, 2.0)));
}

TEST("backward/diamond_accumulates_both_paths") {
    Variable a = scalar(3.0);
    Variable b = dg::square(a);
    Variable c = dg::square(a);
    Variable d = dg::add(b, c);
    d.backward();
    ASSERT_NEAR(a.grad().item(), 4.0 * 3.0, 1e-12);
}

TEST("backward/same_input_twice") {
    Variable x = scalar(3.0);
    Variable y = x + x;
    y.backward();
    ASSERT_NEAR(x.grad().item(), 2.0, 0);
}

TEST("backward/deep_diamond_processes_each_function_once") {
    // y = ((x^2)^2 + (x^2)^2) -> dy/dx = 8x^3
    Variable x = scalar(2.0);
    Variable a = dg::square(x);
    Variable y = dg::add(dg::square(a), dg::square(a));
    y.backward();
    ASSERT_NEAR(x.grad().item(), 64.0, 1e-12);
}

TEST("backward/broadcast_to_sum_to_round_trip") {
    Variable x(Tensor({1.0, 2.0, 3.0}, {3}));
    Variable b = dg::broadcast_to(x, {2, 3});
    Variable y = dg::sum_to(b, {3});
    ASSERT_TRUE(y.shape() == x.shape());
    ASSERT_TRUE(allclose(y.data(), x.data() * 2.0));
    y.backward();
    ASSERT_TRUE(x.grad().shape() == Shape({3}));
    ASSERT_TRUE(allclose(x.grad().data(), Tensor::full({3}, 2.0)));
    ASSERT_TRUE(dg::broadcast_to(x, {3}).same_node(x));
    ASSERT_TRUE(dg::sum_to(x, {3}).same_node(x));
}

TEST("backward/numerical_agrees_with_analytic") {
    Variable x = scalar(2.0);
    Variable y = dg::square(x);
    y.backward();
    const double num = dg::numerical_diff([](const Variable& v) { return dg::square(v); }, x).item();
    ASSERT_NEAR(x.grad().item(), 4.0, 1e-12);
    ASSERT_NEAR(num, x.grad().item(), 1e-4 * 4.0);
}

TEST("backward/unchain_backward_detaches_whole_chain") {
    const int n = 5;
    Variable x = scalar(0.5);
    std::vector<Variable> chain{x};
    for (int i = 0; i < n; ++i) chain.push_back(dg::sin(chain.back()));
    Variable y = chain.back();
    y.unchain_backward();
    for (const auto& v : chain) ASSERT_TRUE(!v.creator());
    y.backward();
    ASSERT_TRUE(y.has_grad());
    ASSERT_NEAR(y.grad().item(), 1.0, 0);
    for (int i = 0; i < n; ++i) ASSERT_TRUE(!chain[i].has_grad());
}

TEST("backward/unchain_cuts_single_edge") {
    Variable x = scalar(1.5);
    Variable h = dg::square(x);
    Variable y = dg::exp(h);
    h.unchain();
    y.backward();
    ASSERT_TRUE(h.has_grad());
    ASSERT_TRUE(!x.has_grad());
    ASSERT_NEAR(h.data().item(), 2.25, 0);
}

TEST("backward/intermediate_grads_cleared_unless_retained") {
    Variable x = scalar(1.0);
    Variable h = dg::square(x);
    Variable y = dg::exp(h);
    y.backward();
    ASSERT_TRUE(!h.has_grad());
    ASSERT_TRUE(y.has_grad());
    ASSERT_TRUE(x.has_grad());

    x.cleargrad();
    Variable h2 = dg::square(x);
    Variable y2 = dg::exp(h2);
    y2.backward(/*retain_grad=*/true);
    ASSERT_TRUE(h2.has_grad());
    ASSERT_NEAR(h2.grad().item(), std::exp(1.0), 1e-12);
}

TEST("backward/leaf_grads_accumulate_until_cleared") {
    Variable x = scalar(3.0);
    Variable y = dg::square(x);
    y.backward();
    y.backward();
    ASSERT_NEAR(x.grad().item(), 12.0, 1e-12);
    x.cleargrad();
    ASSERT_TRUE(!x.has_grad());
    Variable z = dg::square(x);
    z.backward();
    ASSERT_NEAR(x.grad().item(), 6.0, 1e-12);
}

TEST("backward/gradient_has_no_graph_without_create_graph") {
    Variable x = scalar(3.0);
    dg::pow(x, 3.0).backward();
    ASSERT_TRUE(!x.grad().creator());
}

TEST("backward/second_order_of_cube") {
    Variable x = scalar(3.0);
    Variable y = dg::pow(x, 3.0);
    y.backward(/*retain_grad=*/false, /*create_graph=*/true);
    Variable gx = x.grad();
    ASSERT_NEAR(gx.item(), 27.0, 1e-12);
    ASSERT_TRUE(gx.creator() != nullptr);

    x.cleargrad();
    gx.backward();
    ASSERT_NEAR(x.grad().item(), 18.0, 1e-12);
}

TEST("backward/newton_method_with_second_derivative") {
    // f(x) = x^4 - 2x^2 has a minimum at x = 1
    auto f = [](const Variable& x) { return dg::pow(x, 4.0) - 2.0 * dg::pow(x, 2.0); };
    Variable x = scalar(2.0);
    for (int i = 0; i < 10; ++i) {
        Variable y = f(x);
        x.cleargrad();
        y.backward(false, true);
        Variable gx = x.grad();
        x.cleargrad();
        gx.backward();
        Variable gx2 = x.grad();
        x.set_data(x.data() - gx.data() / gx2.data());
    }
    ASSERT_NEAR(x.item(), 1.0, 1e-10);
}

TEST("backward/third_order_of_sin") {
    Variable x = scalar(0.7);
    Variable y = dg::sin(x);
    y.backward(false, true);
    for (int i = 0; i < 2; ++i) {
        Variable gx = x.grad();
        x.cleargrad();
        gx.backward(false, true);
    }
    ASSERT_NEAR(x.grad().item(), -std::cos(0.7), 1e-12);
}

TEST("backward/tanh_higher_order_matches_closed_form") {
    const double v = 0.3;
    Variable x = scalar(v);
    dg::tanh(x).backward(false, true);
    Variable gx = x.grad();
    x.cleargrad();
    gx.backward();
    const double t = std::tanh(v);
    ASSERT_NEAR(gx.item(), 1 - t * t, 1e-12);
    ASSERT_NEAR(x.grad().item(), -2 * t * (1 - t * t), 1e-12);
}

TEST("backward/create_graph_graph_is_freed_with_handles") {
    std::weak_ptr<dg::Node> leaf, grad;
    {
        Variable x = scalar(3.0);
        leaf = x.n;
        dg::pow(x, 3.0).backward(false, true);
        ASSERT_NEAR(x.grad().item(), 27.0, 1e-12);
        grad = x.grad().n;
        ASSERT_TRUE(x.grad().creator() != nullptr);
    }
    ASSERT_TRUE(leaf.expired());
    ASSERT_TRUE(grad.expired());
}

TEST("backward/newton_iterates_release_their_graphs") {
    std::vector<std::weak_ptr<dg::Node>> seen;
    {
        Variable x = scalar(2.0);
        for (int i = 0; i < 7; ++i) {
            seen.push_back(x.n);
            Variable y = dg::pow(x, 4.0) - 2.0 * dg::pow(x, 2.0);
            y.backward(false, true);
            Variable gx = x.grad();
            x.cleargrad();
            gx.backward();
            Variable gx2 = x.grad();
            x = Variable(x.data() - gx.data() / gx2.data());
        }
        ASSERT_NEAR(x.item(), 1.0, 1e-9);
        for (std::size_t i = 0; i < seen.size(); ++i) ASSERT_TRUE(seen[i].expired());
    }
}

TEST("backward/grad_lives_while_a_handle_does") {
    Variable x = scalar(2.0);
    Variable alias = x;
    std::weak_ptr<dg::Node> grad;
    {
        Variable y = dg::exp(x);
        y.backward(true, true);
        grad = x.grad().n;
        ASSERT_TRUE(!grad.expired());
    }
    ASSERT_TRUE(!grad.expired());
    ASSERT_NEAR(alias.grad().item(), std::exp(2.0), 1e-12);
    x = Variable();
    ASSERT_TRUE(!grad.expired());
    alias = Variable();
    ASSERT_TRUE(grad.expired());
}

TEST("backward/long_chain_tears_down_iteratively") {
    const int N = 200000;
    std::weak_ptr<dg::Node> leaf, head;
    {
        Variable x = scalar(0.0);
        leaf = x.n;
        Variable h = x;
        for (int i = 0; i < N; ++i) h = h + 1.0;
        head = h.n;
        h.backward();
        ASSERT_NEAR(h.item(), double(N), 0);
        ASSERT_NEAR(x.grad().item(), 1.0, 0);
        ASSERT_TRUE(h.creator()->generation() == N - 1);
    }
    ASSERT_TRUE(head.expired());
    ASSERT_TRUE(leaf.expired());
}
