#include "dg/core/tensor.hpp"
#include "dg/parallel/parallel_for.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace dg {
using detail::broadcast_two;
using detail::map_aligned;
using detail::numel;
using detail::ravel_index;
using detail::shape_str;
using detail::strides_for;
using detail::unravel_index;

// Parallelization params for elementwise kernels
static constexpr std::size_t ELEM_GRAIN = 2048;
static constexpr std::size_t ROW_GRAIN = 16;

Tensor::Tensor(std::vector<double> data, Shape shape)
  : shape_(std::move(shape)) {
  if (numel(shape_) != data.size())
    throw std::invalid_argument("Tensor: " + std::to_string(data.size()) +
                                " values do not fill shape " + shape_str(shape_));
  data_ = std::make_shared<const std::vector<double>>(std::move(data));
}

const std::vector<double>& Tensor::data() const {
  static const std::vector<double> empty;
  return data_ ? *data_ : empty;
}

Tensor Tensor::scalar(double v) { return Tensor({v}, {1}); }

Tensor Tensor::full(const Shape& shape, double v) {
  return Tensor(std::vector<double>(numel(shape), v), shape);
}

Tensor Tensor::zeros_like(const Tensor& t) {
  t.require_defined("zeros_like");
  return zeros(t.shape());
}

Tensor Tensor::ones_like(const Tensor& t) {
  t.require_defined("ones_like");
  return ones(t.shape());
}

Tensor Tensor::arange(std::size_t n) {
  std::vector<double> v(n);
  for (std::size_t i = 0; i < n; ++i) v[i] = double(i);
  return Tensor(std::move(v), {n});
}

void Tensor::require_defined(const char* op) const {
  if (!data_) throw std::logic_error(std::string(op) + ": tensor has no data");
}

double Tensor::at(const std::vector<std::size_t>& idx) const {
  require_defined("at");
  if (idx.size() != shape_.size()) throw std::out_of_range("at: index rank mismatch");
  for (std::size_t d = 0; d < idx.size(); ++d)
    if (idx[d] >= shape_[d]) throw std::out_of_range("at: index out of range");
  return (*data_)[ravel_index(idx, strides_for(shape_))];
}

double Tensor::item() const {
  require_defined("item");
  if (data_->size() != 1)
    throw std::invalid_argument("item: tensor of shape " + shape_str(shape_) + " is not a scalar");
  return (*data_)[0];
}

Tensor Tensor::reshape(const Shape& new_shape) const {
  require_defined("reshape");
  if (numel(new_shape) != data_->size())
    throw std::invalid_argument("reshape: cannot reshape " + shape_str(shape_) + " to " +
                                shape_str(new_shape));
  Tensor out;
  out.shape_ = new_shape;
  out.data_ = data_;
  return out;
}

Tensor Tensor::transpose(const std::vector<int>& axes_in) const {
  require_defined("transpose");
  const std::size_t R = shape_.size();
  std::vector<std::size_t> axes(R);
  if (axes_in.empty()) {
    for (std::size_t i = 0; i < R; ++i) axes[i] = R - 1 - i;
  } else {
    if (axes_in.size() != R) throw std::invalid_argument("transpose: axes rank mismatch");
    std::vector<bool> seen(R, false);
    for (std::size_t i = 0; i < R; ++i) {
      long a = axes_in[i];
      if (a < 0) a += long(R);
      if (a < 0 || a >= long(R) || seen[std::size_t(a)])
        throw std::invalid_argument("transpose: axes are not a permutation");
      seen[std::size_t(a)] = true;
      axes[i] = std::size_t(a);
    }
  }

  Shape out_shape(R);
  for (std::size_t i = 0; i < R; ++i) out_shape[i] = shape_[axes[i]];
  const auto in_str = strides_for(shape_);
  const std::size_t N = data_->size();
  const double* in = data_->data();
  std::vector<double> out(N);
  parallel::parallel_for(N, ELEM_GRAIN, [&](std::size_t l0, std::size_t l1){
    for (std::size_t lin = l0; lin < l1; ++lin) {
      const auto idx = unravel_index(lin, out_shape);
      std::size_t src = 0;
      for (std::size_t i = 0; i < R; ++i) src += idx[i] * in_str[axes[i]];
      out[lin] = in[src];
    }
  });
  return Tensor(std::move(out), std::move(out_shape));
}

Tensor Tensor::broadcast_to(const Shape& target) const {
  require_defined("broadcast_to");
  if (!detail::broadcastable_to(shape_, target))
    throw std::invalid_argument("broadcast_to: cannot broadcast " + shape_str(shape_) + " to " +
                                shape_str(target));
  if (shape_ == target) return *this;
  const auto in_str = strides_for(shape_);
  const std::size_t N = numel(target);
  const double* in = data_->data();
  std::vector<double> out(N);
  parallel::parallel_for(N, ELEM_GRAIN, [&](std::size_t l0, std::size_t l1){
    for (std::size_t lin = l0; lin < l1; ++lin) {
      const auto idx = unravel_index(lin, target);
      out[lin] = in[map_aligned(idx, target, shape_, in_str)];
    }
  });
  return Tensor(std::move(out), target);
}

Tensor Tensor::sum_to(const Shape& target) const {
  require_defined("sum_to");
  if (shape_ == target) return *this;
  if (target.size() > shape_.size())
    throw std::invalid_argument("sum_to: target " + shape_str(target) + " has more dims than " +
                                shape_str(shape_));
  const std::size_t lead = shape_.size() - target.size();
  std::vector<int> axes;
  for (std::size_t i = 0; i < lead; ++i) axes.push_back(int(i));
  for (std::size_t i = 0; i < target.size(); ++i) {
    if (target[i] == 1 && shape_[lead + i] != 1) axes.push_back(int(lead + i));
    else if (target[i] != shape_[lead + i])
      throw std::invalid_argument("sum_to: cannot reduce " + shape_str(shape_) + " to " +
                                  shape_str(target));
  }
  if (axes.empty()) return reshape(target);
  return sum(axes, /*keepdims=*/true).reshape(target);
}

namespace {

template <class Combine>
Tensor reduce(const Tensor& x, const std::vector<int>& axes_in, bool keepdims,
              double init, Combine combine) {
  const auto& shp = x.shape();
  const auto axes = detail::normalize_axes(axes_in, shp.size());
  const Shape keep = detail::keepdims_shape(shp, axes);
  const auto keep_str = strides_for(keep);
  const std::size_t outN = numel(keep);
  std::vector<double> out(outN, init);
  const auto& in = x.data();
  for (std::size_t lin = 0; lin < in.size(); ++lin) {
    auto idx = unravel_index(lin, shp);
    for (auto a : axes) idx[a] = 0;
    const std::size_t o = ravel_index(idx, keep_str);
    out[o] = combine(out[o], in[lin]);
  }
  return Tensor(std::move(out), detail::reduced_shape(shp, axes, keepdims));
}

} // namespace

Tensor Tensor::sum(const std::vector<int>& axes, bool keepdims) const {
  require_defined("sum");
  return reduce(*this, axes, keepdims, 0.0, [](double acc, double v){ return acc + v; });
}

Tensor Tensor::max(const std::vector<int>& axes, bool keepdims) const {
  require_defined("max");
  if (data_->empty()) throw std::invalid_argument("max: empty tensor");
  return reduce(*this, axes, keepdims, -std::numeric_limits<double>::infinity(),
                [](double acc, double v){ return std::max(acc, v); });
}

Tensor Tensor::min(const std::vector<int>& axes, bool keepdims) const {
  require_defined("min");
  if (data_->empty()) throw std::invalid_argument("min: empty tensor");
  return reduce(*this, axes, keepdims, std::numeric_limits<double>::infinity(),
                [](double acc, double v){ return std::min(acc, v); });
}

Tensor Tensor::argmax(int axis) const {
  require_defined("argmax");
  const auto ax = detail::normalize_axes({axis}, shape_.size());
  const std::size_t a = ax.front();
  const std::size_t D = shape_[a];
  if (D == 0) throw std::invalid_argument("argmax: empty axis");
  const Shape keep = detail::keepdims_shape(shape_, ax);
  const auto str = strides_for(shape_);
  const std::size_t outN = numel(keep);
  std::vector<double> out(outN);
  for (std::size_t o = 0; o < outN; ++o) {
    const auto idx = unravel_index(o, keep);
    const std::size_t base = ravel_index(idx, str);
    std::size_t best = 0;
    double bv = (*data_)[base];
    for (std::size_t k = 1; k < D; ++k) {
      const double v = (*data_)[base + k * str[a]];
      if (v > bv) { bv = v; best = k; }
    }
    out[o] = double(best);
  }
  return Tensor(std::move(out), detail::reduced_shape(shape_, ax, false));
}

// ---------- slicing ----------
namespace {

struct Selection {
  std::vector<std::vector<std::size_t>> pos; // source positions per dim
  Shape full;                                // per-dim selection sizes
  Shape out;                                 // with Index dims dropped
};

std::size_t wrap_index(long long i, std::size_t dim) {
  long long ii = i;
  if (ii < 0) ii += (long long)dim;
  if (ii < 0 || (std::size_t)ii >= dim)
    throw std::out_of_range("index " + std::to_string(i) + " out of range for dim " +
                            std::to_string(dim));
  return (std::size_t)ii;
}

Selection resolve(const Shape& xs, const std::vector<Slice>& requested) {
  const std::size_t R = xs.size();
  if (requested.size() > R) throw std::invalid_argument("slice: too many indices");
  std::vector<Slice> slices = requested;
  slices.resize(R, Slice::all());

  Selection sel;
  sel.pos.resize(R);
  sel.full.resize(R);
  for (std::size_t d = 0; d < R; ++d) {
    const auto& s = slices[d];
    const long long dim = (long long)xs[d];
    auto& p = sel.pos[d];
    switch (s.kind) {
      case Slice::Kind::Index:
        p.push_back(wrap_index(s.start, xs[d]));
        break;
      case Slice::Kind::Take:
        for (long long i : s.positions) p.push_back(wrap_index(i, xs[d]));
        break;
      case Slice::Kind::Range: {
        if (s.step <= 0) throw std::invalid_argument("slice: step must be positive");
        long long a = s.start < 0 ? s.start + dim : s.start;
        long long b = s.stop < 0 ? s.stop + dim : s.stop;
        a = std::clamp(a, 0LL, dim);
        b = std::clamp(b, 0LL, dim);
        for (long long i = a; i < b; i += s.step) p.push_back(std::size_t(i));
        break;
      }
    }
    sel.full[d] = p.size();
    if (s.kind != Slice::Kind::Index) sel.out.push_back(p.size());
  }
  if (sel.out.empty()) sel.out = {1};
  return sel;
}

} // namespace

Tensor Tensor::slice(const std::vector<Slice>& slices) const {
  require_defined("slice");
  const auto sel = resolve(shape_, slices);
  const auto xstr = strides_for(shape_);
  const std::size_t N = numel(sel.full);
  std::vector<double> out(N);
  for (std::size_t lin = 0; lin < N; ++lin) {
    const auto idx = unravel_index(lin, sel.full);
    std::size_t src = 0;
    for (std::size_t d = 0; d < idx.size(); ++d) src += sel.pos[d][idx[d]] * xstr[d];
    out[lin] = (*data_)[src];
  }
  return Tensor(std::move(out), sel.out);
}

Tensor index_add(const Shape& shape, const std::vector<Slice>& slices, const Tensor& src) {
  if (!src.defined()) throw std::logic_error("index_add: tensor has no data");
  const auto sel = resolve(shape, slices);
  const std::size_t N = numel(sel.full);
  if (src.size() != N)
    throw std::invalid_argument("index_add: source of shape " + shape_str(src.shape()) +
                                " does not match selection " + shape_str(sel.out));
  const auto xstr = strides_for(shape);
  std::vector<double> out(numel(shape), 0.0);
  for (std::size_t lin = 0; lin < N; ++lin) {
    const auto idx = unravel_index(lin, sel.full);
    std::size_t dst = 0;
    for (std::size_t d = 0; d < idx.size(); ++d) dst += sel.pos[d][idx[d]] * xstr[d];
    out[dst] += src[lin];
  }
  return Tensor(std::move(out), shape);
}

// ---------- elementwise ----------
namespace {

template <class Op>
Tensor binary(const Tensor& a, const Tensor& b, Op op, const char* name) {
  if (!a.defined() || !b.defined()) throw std::logic_error(std::string(name) + ": tensor has no data");
  const Shape out_shape = broadcast_two(a.shape(), b.shape());
  const std::size_t N = numel(out_shape);
  std::vector<double> out(N);
  const double* av = a.data().data();
  const double* bv = b.data().data();

  if (a.shape() == out_shape && b.shape() == out_shape) {
    parallel::parallel_for(N, ELEM_GRAIN, [&](std::size_t l0, std::size_t l1){
      for (std::size_t i = l0; i < l1; ++i) out[i] = op(av[i], bv[i]);
    });
  } else {
    const auto As = strides_for(a.shape()), Bs = strides_for(b.shape());
    parallel::parallel_for(N, ELEM_GRAIN, [&](std::size_t l0, std::size_t l1){
      for (std::size_t lin = l0; lin < l1; ++lin) {
        const auto idx = unravel_index(lin, out_shape);
        out[lin] = op(av[map_aligned(idx, out_shape, a.shape(), As)],
                      bv[map_aligned(idx, out_shape, b.shape(), Bs)]);
      }
    });
  }
  return Tensor(std::move(out), out_shape);
}

template <class Op>
Tensor unary(const Tensor& a, Op op, const char* name) {
  if (!a.defined()) throw std::logic_error(std::string(name) + ": tensor has no data");
  const std::size_t N = a.size();
  std::vector<double> out(N);
  const double* av = a.data().data();
  parallel::parallel_for(N, ELEM_GRAIN, [&](std::size_t l0, std::size_t l1){
    for (std::size_t i = l0; i < l1; ++i) out[i] = op(av[i]);
  });
  return Tensor(std::move(out), a.shape());
}

} // namespace

Tensor operator+(const Tensor& a, const Tensor& b) { return binary(a, b, [](double x, double y){ return x + y; }, "add"); }
Tensor operator-(const Tensor& a, const Tensor& b) { return binary(a, b, [](double x, double y){ return x - y; }, "sub"); }
Tensor operator*(const Tensor& a, const Tensor& b) { return binary(a, b, [](double x, double y){ return x * y; }, "mul"); }
Tensor operator/(const Tensor& a, const Tensor& b) { return binary(a, b, [](double x, double y){ return x / y; }, "div"); }
Tensor operator-(const Tensor& a) { return unary(a, [](double x){ return -x; }, "neg"); }

Tensor operator+(const Tensor& a, double s) { return unary(a, [s](double x){ return x + s; }, "add"); }
Tensor operator-(const Tensor& a, double s) { return unary(a, [s](double x){ return x - s; }, "sub"); }
Tensor operator*(const Tensor& a, double s) { return unary(a, [s](double x){ return x * s; }, "mul"); }
Tensor operator/(const Tensor& a, double s) { return unary(a, [s](double x){ return x / s; }, "div"); }
Tensor operator+(double s, const Tensor& a) { return a + s; }
Tensor operator-(double s, const Tensor& a) { return unary(a, [s](double x){ return s - x; }, "sub"); }
Tensor operator*(double s, const Tensor& a) { return a * s; }
Tensor operator/(double s, const Tensor& a) { return unary(a, [s](double x){ return s / x; }, "div"); }

Tensor pow(const Tensor& a, double c) { return unary(a, [c](double x){ return std::pow(x, c); }, "pow"); }
Tensor exp(const Tensor& a)  { return unary(a, [](double x){ return std::exp(x); }, "exp"); }
Tensor log(const Tensor& a)  { return unary(a, [](double x){ return std::log(x); }, "log"); }
Tensor sin(const Tensor& a)  { return unary(a, [](double x){ return std::sin(x); }, "sin"); }
Tensor cos(const Tensor& a)  { return unary(a, [](double x){ return std::cos(x); }, "cos"); }
Tensor tanh(const Tensor& a) { return unary(a, [](double x){ return std::tanh(x); }, "tanh"); }

Tensor maximum(const Tensor& a, double s) { return unary(a, [s](double x){ return std::max(x, s); }, "maximum"); }
Tensor eq(const Tensor& a, const Tensor& b) { return binary(a, b, [](double x, double y){ return x == y ? 1.0 : 0.0; }, "eq"); }
Tensor gt(const Tensor& a, double s) { return unary(a, [s](double x){ return x > s ? 1.0 : 0.0; }, "gt"); }

Tensor matmul(const Tensor& a, const Tensor& b) {
  if (!a.defined() || !b.defined()) throw std::logic_error("matmul: tensor has no data");
  if (a.ndim() != 2 || b.ndim() != 2)
    throw std::invalid_argument("matmul: expected 2-D operands, got " + shape_str(a.shape()) +
                                " and " + shape_str(b.shape()));
  const std::size_t M = a.shape()[0], K = a.shape()[1], N = b.shape()[1];
  if (b.shape()[0] != K)
    throw std::invalid_argument("matmul: inner dims differ: " + shape_str(a.shape()) + " @ " +
                                shape_str(b.shape()));
  std::vector<double> out(M * N, 0.0);
  const double* A = a.data().data();
  const double* B = b.data().data();
  parallel::parallel_for(M, ROW_GRAIN, [&](std::size_t i0, std::size_t i1){
    for (std::size_t i = i0; i < i1; ++i) {
      double* crow = out.data() + i * N;
      for (std::size_t k = 0; k < K; ++k) {
        const double aik = A[i * K + k];
        const double* brow = B + k * N;
        for (std::size_t j = 0; j < N; ++j) crow[j] += aik * brow[j];
      }
    }
  });
  return Tensor(std::move(out), {M, N});
}

bool allclose(const Tensor& a, const Tensor& b, double rtol, double atol) {
  if (!a.defined() || !b.defined()) return a.defined() == b.defined();
  if (a.shape() != b.shape()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::fabs(a[i] - b[i]) > atol + rtol * std::fabs(b[i])) return false;
  }
  return true;
}

} // namespace dg
