#include "dg/ops/reduce.hpp"
#include "dg/core/function.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/shape.hpp"

namespace dg {
using detail::keepdims_shape;
using detail::normalize_axes;
using detail::numel;

namespace {

// Restores the reduced axes of gy as size-1 dims so it broadcasts against x.
Variable reshape_reduced(const Variable& gy, const Shape& x_shape,
                         const std::vector<int>& axes, bool keepdims) {
  if (keepdims) return gy;
  return reshape(gy, keepdims_shape(x_shape, normalize_axes(axes, x_shape.size())));
}

class Sum final : public Function {
public:
  Sum(std::vector<int> axes, bool keepdims) : axes_(std::move(axes)), keepdims_(keepdims) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    x_shape_ = xs[0].shape();
    return {xs[0].sum(axes_, keepdims_)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable gy = reshape_reduced(gys[0], x_shape_, axes_, keepdims_);
    return {broadcast_to(gy, x_shape_)};
  }
  const char* name() const override { return "Sum"; }
private:
  std::vector<int> axes_;
  bool keepdims_;
  Shape x_shape_;
};

class BroadcastTo final : public Function {
public:
  explicit BroadcastTo(Shape shape) : shape_(std::move(shape)) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    x_shape_ = xs[0].shape();
    return {xs[0].broadcast_to(shape_)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {sum_to(gys[0], x_shape_)};
  }
  const char* name() const override { return "BroadcastTo"; }
private:
  Shape shape_, x_shape_;
};

class SumTo final : public Function {
public:
  explicit SumTo(Shape shape) : shape_(std::move(shape)) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    x_shape_ = xs[0].shape();
    return {xs[0].sum_to(shape_)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {broadcast_to(gys[0], x_shape_)};
  }
  const char* name() const override { return "SumTo"; }
private:
  Shape shape_, x_shape_;
};

// Max and Min share everything but the reduction.
class Extremum final : public Function {
public:
  Extremum(bool is_max, std::vector<int> axes, bool keepdims)
    : is_max_(is_max), axes_(std::move(axes)), keepdims_(keepdims) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    return {is_max_ ? xs[0].max(axes_, keepdims_) : xs[0].min(axes_, keepdims_)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Tensor x = input(0).data();
    const Tensor y = is_max_ ? x.max(axes_, true) : x.min(axes_, true);
    const Variable mask(eq(x, y));
    const Variable gy = reshape_reduced(gys[0], x.shape(), axes_, keepdims_);
    return {broadcast_to(gy, x.shape()) * mask};
  }
  const char* name() const override { return is_max_ ? "Max" : "Min"; }
private:
  bool is_max_;
  std::vector<int> axes_;
  bool keepdims_;
};

} // namespace

Variable sum(const Variable& x, const std::vector<int>& axes, bool keepdims) {
  return call<Sum>({x}, axes, keepdims);
}

Variable broadcast_to(const Variable& x, const Shape& shape) {
  if (x.shape() == shape) return x;
  return call<BroadcastTo>({x}, shape);
}

Variable sum_to(const Variable& x, const Shape& shape) {
  if (x.shape() == shape) return x;
  return call<SumTo>({x}, shape);
}

Variable max(const Variable& x, const std::vector<int>& axes, bool keepdims) {
  return call<Extremum>({x}, true, axes, keepdims);
}

Variable min(const Variable& x, const std::vector<int>& axes, bool keepdims) {
  return call<Extremum>({x}, false, axes, keepdims);
}

Variable mean(const Variable& x, const std::vector<int>& axes, bool keepdims) {
  const auto ax = normalize_axes(axes, x.ndim());
  std::size_t count = 1;
  for (auto a : ax) count *= x.shape()[a];
  return sum(x, axes, keepdims) / double(count);
}

} // namespace dg
