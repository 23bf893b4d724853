#include "dg/ops/shape.hpp"
#include "dg/core/function.hpp"

namespace dg {
namespace {

class Reshape final : public Function {
public:
  explicit Reshape(Shape shape) : shape_(std::move(shape)) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    x_shape_ = xs[0].shape();
    return {xs[0].reshape(shape_)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {reshape(gys[0], x_shape_)};
  }
  const char* name() const override { return "Reshape"; }
private:
  Shape shape_, x_shape_;
};

class Transpose final : public Function {
public:
  explicit Transpose(std::vector<int> axes) : axes_(std::move(axes)) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    rank_ = xs[0].ndim();
    return {xs[0].transpose(axes_)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    if (axes_.empty()) return {transpose(gys[0])};
    // argsort of the permutation
    std::vector<int> inv(rank_);
    for (std::size_t i = 0; i < rank_; ++i) {
      int a = axes_[i] < 0 ? axes_[i] + int(rank_) : axes_[i];
      inv[std::size_t(a)] = int(i);
    }
    return {transpose(gys[0], inv)};
  }
  const char* name() const override { return "Transpose"; }
private:
  std::vector<int> axes_;
  std::size_t rank_ = 0;
};

} // namespace

Variable reshape(const Variable& x, const Shape& shape) {
  if (x.shape() == shape) return x;
  return call<Reshape>({x}, shape);
}

Variable transpose(const Variable& x, const std::vector<int>& axes) {
  return call<Transpose>({x}, axes);
}

} // namespace dg
