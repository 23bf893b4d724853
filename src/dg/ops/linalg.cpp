#include "dg/ops/linalg.hpp"
#include "dg/core/function.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/reduce.hpp"

namespace dg {
namespace {

class MatMul final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    return {dg::matmul(xs[0], xs[1])};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable x = input(0), W = input(1);
    return {matmul(gys[0], W.T()), matmul(x.T(), gys[0])};
  }
  const char* name() const override { return "MatMul"; }
};

class Linear final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    Tensor y = dg::matmul(xs[0], xs[1]);
    if (xs.size() == 3) y = y + xs[2];
    return {y};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable& gy = gys[0];
    const Variable x = input(0), W = input(1);
    std::vector<Variable> gxs{matmul(gy, W.T()), matmul(x.T(), gy)};
    if (num_inputs() == 3) gxs.push_back(sum_to(gy, input(2).shape()));
    return gxs;
  }
  const char* name() const override { return "Linear"; }
};

} // namespace

Variable matmul(const Variable& x, const Variable& W) { return call<MatMul>({x, W}); }

Variable linear(const Variable& x, const Variable& W, const Variable& b) {
  if (b.defined()) return call<Linear>({x, W, b});
  return call<Linear>({x, W});
}

} // namespace dg
