#include "dg/ops/activations.hpp"
#include "dg/core/function.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/reduce.hpp"

namespace dg {
namespace {

class Sigmoid final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    return {dg::tanh(xs[0] * 0.5) * 0.5 + 0.5};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    Variable y = output(0);
    if (!y.defined()) y = sigmoid(input(0));
    return {gys[0] * y * (1.0 - y)};
  }
  const char* name() const override { return "Sigmoid"; }
};

class ReLU final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    return {maximum(xs[0], 0.0)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable mask(gt(input(0).data(), 0.0));
    return {gys[0] * mask};
  }
  const char* name() const override { return "ReLU"; }
};

class Softmax final : public Function {
public:
  explicit Softmax(int axis) : axis_(axis) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    const Tensor& x = xs[0];
    const Tensor e = dg::exp(x - x.max({axis_}, true));
    return {e / e.sum({axis_}, true)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    Variable y = output(0);
    if (!y.defined()) y = softmax(input(0), axis_);
    const Variable gx = y * gys[0];
    const Variable sumdx = sum(gx, {axis_}, true);
    return {gx - y * sumdx};
  }
  const char* name() const override { return "Softmax"; }
private:
  int axis_;
};

} // namespace

Variable sigmoid(const Variable& x) { return call<Sigmoid>({x}); }
Variable relu(const Variable& x) { return call<ReLU>({x}); }
Variable softmax(const Variable& x, int axis) { return call<Softmax>({x}, axis); }

} // namespace dg
