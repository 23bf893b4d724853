// tests/test_ops_values.cpp
#include "test_framework.hpp"
#include "grad_check.hpp"
#include "dg/core/config.hpp"
#include "dg/core/function.hpp"
#include "dg/ops/activations.hpp"
#include "dg/ops/dropout.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/linalg.hpp"
#include "dg/ops/loss.hpp"
#include "dg/ops/reduce.hpp"
#include "dg/ops/shape.hpp"
#include "dg/ops/slice.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

using dg::Shape;
using dg::Slice;
using dg::Tensor;
using dg::Variable;

TEST("ops/get_item_repeated_indices_accumulate") {
    Variable x(Tensor({1.0, 2.0, 3.0}, {3}));
    Variable y = dg::get_item(x, {Slice::take({0, 0, 2})});
    ASSERT_TRUE(y.shape() == Shape({3}));
    ASSERT_NEAR(y.data()[1], 1.0, 0);
    y.backward();
    ASSERT_NEAR(x.grad().data()[0], 2.0, 0);
    ASSERT_NEAR(x.grad().data()[1], 0.0, 0);
    ASSERT_NEAR(x.grad().data()[2], 1.0, 0);
}

TEST("ops/get_item_grad_is_differentiable") {
    Variable x(tfw::wave({3, 2}));
    dg::sum(dg::square(dg::get_item(x, {Slice::index(2)}))).backward(false, true);
    Variable gx = x.grad();
    ASSERT_TRUE(std::string(gx.creator()->name()) == "GetItemGrad");
    x.cleargrad();
    dg::sum(gx).backward();
    // d/dx sum(2 * x[2]) = 2 on the selected row, 0 elsewhere
    ASSERT_NEAR(x.grad().data()[0], 0.0, 0);
    ASSERT_NEAR(x.grad().data()[4], 2.0, 1e-12);
    ASSERT_NEAR(x.grad().data()[5], 2.0, 1e-12);
}

TEST("ops/linear_without_bias_has_two_inputs") {
    Variable x(tfw::wave({2, 3}));
    Variable W(tfw::wave({3, 4}, 1.0));
    Variable y = dg::linear(x, W);
    ASSERT_TRUE(y.creator()->num_inputs() == 2);
    ASSERT_TRUE(dg::allclose(y.data(), dg::matmul(x, W).data()));
    y.backward();
    ASSERT_TRUE(W.grad().shape() == Shape({3, 4}));

    Variable b(Tensor({1.0, 2.0, 3.0, 4.0}, {4}));
    Variable yb = dg::linear(x, W, b);
    ASSERT_TRUE(yb.creator()->num_inputs() == 3);
    yb.backward();
    ASSERT_TRUE(dg::allclose(b.grad().data(), Tensor::full({4}, 2.0)));
}

TEST("ops/transpose_inverse_permutation") {
    Variable x(tfw::wave({2, 3, 4}));
    Variable y = dg::transpose(x, {2, 0, 1});
    ASSERT_TRUE(y.shape() == Shape({4, 2, 3}));
    y.backward();
    ASSERT_TRUE(x.grad().shape() == Shape({2, 3, 4}));
    ASSERT_TRUE(dg::reshape(x, {2, 3, 4}).same_node(x));
}

TEST("ops/sum_scalar_shape_and_mean_value") {
    Variable x(Tensor({1.0, 2.0, 3.0, 4.0}, {2, 2}));
    Variable s = x.sum();
    ASSERT_TRUE(s.shape() == Shape({1}));
    ASSERT_NEAR(s.item(), 10.0, 0);
    ASSERT_NEAR(dg::mean(x).item(), 2.5, 0);
    ASSERT_NEAR(dg::mean(x, {0}).data()[1], 3.0, 0);
    ASSERT_NEAR(dg::max(x).item(), 4.0, 0);
    ASSERT_NEAR(dg::min(x, {1}).data()[1], 3.0, 0);
}

TEST("ops/max_ties_share_gradient") {
    Variable x(Tensor({1.0, 3.0, 3.0}, {3}));
    dg::max(x).backward();
    ASSERT_NEAR(x.grad().data()[0], 0.0, 0);
    ASSERT_NEAR(x.grad().data()[1], 1.0, 0);
    ASSERT_NEAR(x.grad().data()[2], 1.0, 0);
}

TEST("ops/activation_values") {
    Variable z(Tensor({0.0, -2.0, 2.0}, {3}));
    ASSERT_NEAR(dg::sigmoid(z).data()[0], 0.5, 1e-15);
    ASSERT_NEAR(dg::sigmoid(z).data()[2], 1.0 / (1.0 + std::exp(-2.0)), 1e-12);
    Variable r = dg::relu(z);
    ASSERT_NEAR(r.data()[1], 0.0, 0);
    ASSERT_NEAR(r.data()[2], 2.0, 0);

    Variable logits(Tensor({1.0, 2.0, 3.0, 1000.0, 1000.0, 1000.0}, {2, 3}));
    Variable p = dg::softmax(logits);
    for (std::size_t i = 0; i < 2; ++i) {
        double row = 0.0;
        for (std::size_t j = 0; j < 3; ++j) row += p.data().at({i, j});
        ASSERT_NEAR(row, 1.0, 1e-12);
    }
    ASSERT_NEAR(p.data().at({1, 0}), 1.0 / 3.0, 1e-12);
}

TEST("ops/loss_values") {
    Variable a(Tensor({1.0, 2.0}, {2}));
    Variable b(Tensor({0.0, 0.0}, {2}));
    ASSERT_NEAR(dg::mean_squared_error(a, b).item(), 2.5, 1e-12);

    Variable x(Tensor::zeros({2, 3}));
    Variable t(Tensor({0.0, 2.0}, {2}));
    Variable loss = dg::softmax_cross_entropy(x, t);
    ASSERT_NEAR(loss.item(), std::log(3.0), 1e-12);
    loss.backward();
    // (softmax - onehot) / N
    ASSERT_NEAR(x.grad().data().at({0, 0}), (1.0 / 3.0 - 1.0) / 2.0, 1e-12);
    ASSERT_NEAR(x.grad().data().at({0, 1}), (1.0 / 3.0) / 2.0, 1e-12);
    ASSERT_TRUE(!t.has_grad());

    Variable big(Tensor({1000.0, 0.0}, {1, 2}));
    Variable l2 = dg::softmax_cross_entropy(big, Variable(Tensor({1.0}, {1})));
    ASSERT_NEAR(l2.item(), 1000.0, 1e-9);

    ASSERT_THROWS(dg::softmax_cross_entropy(x, Variable(Tensor({0.0, 3.0}, {2}))), std::out_of_range);
    ASSERT_THROWS(dg::softmax_cross_entropy(x, Variable(Tensor({0.0}, {1}))), std::invalid_argument);
}

TEST("ops/dropout_masks_and_scales") {
    dg::UsingConfig train(dg::ConfigFlag::Train, true);
    Variable x(Tensor::ones({100, 100}));
    Variable y = dg::dropout(x, 0.5, 42);
    std::size_t zeros = 0;
    for (double v : y.data().data()) {
        ASSERT_TRUE(v == 0.0 || v == 2.0);
        if (v == 0.0) ++zeros;
    }
    ASSERT_TRUE(zeros > 4500 && zeros < 5500);

    Variable y2 = dg::dropout(x, 0.5, 42);
    ASSERT_TRUE(dg::allclose(y.data(), y2.data()));

    y.backward();
    for (std::size_t i = 0; i < 100; ++i) ASSERT_NEAR(x.grad().data()[i], y.data()[i], 0);

    ASSERT_TRUE(dg::allclose(dg::dropout(x, 0.0).data(), x.data()));
    ASSERT_THROWS(dg::dropout(x, 1.0), std::invalid_argument);
}

TEST("ops/dropout_neighbouring_seeds_are_not_shifted") {
    dg::UsingConfig train(dg::ConfigFlag::Train, true);
    const std::size_t N = 4000;
    Variable x(Tensor::ones({N}));
    Variable y7 = dg::dropout(x, 0.5, 7);
    Variable y8 = dg::dropout(x, 0.5, 8);
    const auto& m7 = y7.data().data();
    const auto& m8 = y8.data().data();
    std::size_t same = 0, shifted = 0;
    for (std::size_t i = 0; i + 1 < N; ++i) {
        if (m8[i] == m7[i]) ++same;
        if (m8[i] == m7[i + 1]) ++shifted;
    }
    // independent masks agree on about half the positions
    ASSERT_TRUE(shifted < N * 6 / 10);
    ASSERT_TRUE(same < N * 6 / 10);
}

TEST("ops/shape_errors_propagate_from_forward") {
    Variable a(Tensor::ones({2, 3}));
    Variable b(Tensor::ones({4}));
    ASSERT_THROWS(a + b, std::invalid_argument);
    ASSERT_THROWS(dg::matmul(a, a), std::invalid_argument);
    ASSERT_THROWS(dg::reshape(a, {5}), std::invalid_argument);
    ASSERT_THROWS(dg::sum_to(a, {4}), std::invalid_argument);
}
