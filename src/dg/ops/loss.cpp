#include "dg/ops/loss.hpp"
#include "dg/core/function.hpp"
#include "dg/ops/activations.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/numeric.hpp"
#include "dg/ops/reduce.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace dg {
using detail::shape_str;

namespace {

class MeanSquaredError final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    const Tensor diff = xs[0] - xs[1];
    if (diff.ndim() == 0 || diff.shape()[0] == 0)
      throw std::invalid_argument("mean_squared_error: empty batch");
    return {pow(diff, 2.0).sum() / double(diff.shape()[0])};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable x0 = input(0), x1 = input(1);
    const Variable diff = x0 - x1;
    const Variable gy = broadcast_to(gys[0], diff.shape());
    Variable gx0 = gy * diff * (2.0 / double(diff.shape()[0]));
    Variable gx1 = -gx0;
    return {sum_to(gx0, x0.shape()), sum_to(gx1, x1.shape())};
  }
  const char* name() const override { return "MeanSquaredError"; }
};

class SoftmaxCrossEntropy final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    const Tensor& x = xs[0];
    const Tensor& t = xs[1];
    if (x.ndim() != 2)
      throw std::invalid_argument("softmax_cross_entropy: expected [N, C] logits, got " +
                                  shape_str(x.shape()));
    const std::size_t N = x.shape()[0], C = x.shape()[1];
    if (t.size() != N)
      throw std::invalid_argument("softmax_cross_entropy: " + std::to_string(t.size()) +
                                  " labels for batch of " + std::to_string(N));
    labels_.resize(N);
    for (std::size_t i = 0; i < N; ++i) {
      const double v = t[i];
      if (v < 0 || v >= double(C) || v != std::floor(v))
        throw std::out_of_range("softmax_cross_entropy: label " + std::to_string(v) +
                                " is not a class index below " + std::to_string(C));
      labels_[i] = std::size_t(v);
    }
    const Tensor log_p = x - logsumexp(x, 1);
    double acc = 0.0;
    for (std::size_t i = 0; i < N; ++i) acc += log_p[i * C + labels_[i]];
    return {Tensor::scalar(-acc / double(N))};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable x = input(0);
    const std::size_t N = x.shape()[0], C = x.shape()[1];
    std::vector<double> onehot(N * C, 0.0);
    for (std::size_t i = 0; i < N; ++i) onehot[i * C + labels_[i]] = 1.0;
    const Variable t_onehot(Tensor(std::move(onehot), {N, C}));
    const Variable y = softmax(x, 1);
    return {(y - t_onehot) * gys[0] / double(N), Variable()};
  }
  const char* name() const override { return "SoftmaxCrossEntropy"; }
private:
  std::vector<std::size_t> labels_;
};

} // namespace

Variable mean_squared_error(const Variable& x0, const Variable& x1) {
  return call<MeanSquaredError>({x0, x1});
}

Variable softmax_cross_entropy(const Variable& x, const Variable& t) {
  return call<SoftmaxCrossEntropy>({x, t});
}

} // namespace dg
