#include "dg/ops/slice.hpp"
#include "dg/core/function.hpp"

namespace dg {
namespace {

class GetItem final : public Function {
public:
  explicit GetItem(std::vector<Slice> slices) : slices_(std::move(slices)) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    in_shape_ = xs[0].shape();
    return {xs[0].slice(slices_)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {get_item_grad(gys[0], slices_, in_shape_)};
  }
  const char* name() const override { return "GetItem"; }
private:
  std::vector<Slice> slices_;
  Shape in_shape_;
};

class GetItemGrad final : public Function {
public:
  GetItemGrad(std::vector<Slice> slices, Shape in_shape)
    : slices_(std::move(slices)), in_shape_(std::move(in_shape)) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    return {index_add(in_shape_, slices_, xs[0])};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {get_item(gys[0], slices_)};
  }
  const char* name() const override { return "GetItemGrad"; }
private:
  std::vector<Slice> slices_;
  Shape in_shape_;
};

} // namespace

Variable get_item(const Variable& x, const std::vector<Slice>& slices) {
  return call<GetItem>({x}, slices);
}

Variable get_item_grad(const Variable& gy, const std::vector<Slice>& slices, const Shape& in_shape) {
  return call<GetItemGrad>({gy}, slices, in_shape);
}

} // namespace dg
