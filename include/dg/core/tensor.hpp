#pragma once
#include <cstddef>
#include <limits>
#include <memory>
#include <vector>

#include "dg/core/shape.hpp"

namespace dg {

// Per-dimension selection used by Tensor::slice / index_add and get_item.
// - index(i): picks a single position and drops the dimension.
// - range(start, stop, step): half-open [start, stop) with step > 0; negative
//   bounds wrap, out-of-range bounds clamp (NumPy slice semantics).
// - take(positions): gathers arbitrary positions (may repeat); keeps the dim.
struct Slice {
  enum class Kind { Index, Range, Take };
  Kind kind = Kind::Range;
  long long start = 0;
  long long stop = std::numeric_limits<long long>::max();
  long long step = 1;
  std::vector<long long> positions;

  static Slice all() { return Slice{}; }
  static Slice index(long long i) { Slice s; s.kind = Kind::Index; s.start = i; return s; }
  static Slice range(long long start, long long stop, long long step = 1) {
    Slice s; s.start = start; s.stop = stop; s.step = step; return s;
  }
  static Slice take(std::vector<long long> pos) {
    Slice s; s.kind = Kind::Take; s.positions = std::move(pos); return s;
  }
};

// Dense row-major N-D buffer of doubles. Storage is immutable and shared
// between copies; every operation returns a new Tensor.
// A default-constructed Tensor is undefined ("absent" data).
class Tensor {
public:
  Tensor() = default;
  Tensor(std::vector<double> data, Shape shape);

  static Tensor scalar(double v);
  static Tensor full(const Shape& shape, double v);
  static Tensor zeros(const Shape& shape) { return full(shape, 0.0); }
  static Tensor ones(const Shape& shape)  { return full(shape, 1.0); }
  static Tensor zeros_like(const Tensor& t);
  static Tensor ones_like(const Tensor& t);
  static Tensor arange(std::size_t n);

  bool defined() const { return data_ != nullptr; }
  const Shape& shape() const { return shape_; }
  std::size_t ndim() const { return shape_.size(); }
  std::size_t size() const { return data_ ? data_->size() : 0; }
  const std::vector<double>& data() const;

  double operator[](std::size_t flat) const { return (*data_)[flat]; }
  double at(const std::vector<std::size_t>& idx) const;
  double item() const;

  Tensor reshape(const Shape& new_shape) const;
  // Permutes axes; an empty list reverses them.
  Tensor transpose(const std::vector<int>& axes = {}) const;
  Tensor broadcast_to(const Shape& target) const;
  // Sums over leading axes and over axes where `target` has size 1.
  Tensor sum_to(const Shape& target) const;

  Tensor sum(const std::vector<int>& axes = {}, bool keepdims = false) const;
  Tensor max(const std::vector<int>& axes = {}, bool keepdims = false) const;
  Tensor min(const std::vector<int>& axes = {}, bool keepdims = false) const;
  // Flat position of the maximum along `axis` (first one on ties); the
  // axis is dropped from the result shape.
  Tensor argmax(int axis) const;

  Tensor slice(const std::vector<Slice>& slices) const;

private:
  void require_defined(const char* op) const;

  Shape shape_;
  std::shared_ptr<const std::vector<double>> data_;
};

// Elementwise arithmetic with broadcasting.
Tensor operator+(const Tensor& a, const Tensor& b);
Tensor operator-(const Tensor& a, const Tensor& b);
Tensor operator*(const Tensor& a, const Tensor& b);
Tensor operator/(const Tensor& a, const Tensor& b);
Tensor operator-(const Tensor& a);

Tensor operator+(const Tensor& a, double s);
Tensor operator-(const Tensor& a, double s);
Tensor operator*(const Tensor& a, double s);
Tensor operator/(const Tensor& a, double s);
Tensor operator+(double s, const Tensor& a);
Tensor operator-(double s, const Tensor& a);
Tensor operator*(double s, const Tensor& a);
Tensor operator/(double s, const Tensor& a);

Tensor pow(const Tensor& a, double c);
Tensor exp(const Tensor& a);
Tensor log(const Tensor& a);
Tensor sin(const Tensor& a);
Tensor cos(const Tensor& a);
Tensor tanh(const Tensor& a);

Tensor maximum(const Tensor& a, double s);
// 1.0 where a == b (broadcast), 0.0 elsewhere.
Tensor eq(const Tensor& a, const Tensor& b);
// 1.0 where a > s, 0.0 elsewhere.
Tensor gt(const Tensor& a, double s);

// 2-D matrix product [M,K] @ [K,N] -> [M,N].
Tensor matmul(const Tensor& a, const Tensor& b);

// zeros(shape) with `src` added at the positions selected by `slices`;
// repeated positions accumulate.
Tensor index_add(const Shape& shape, const std::vector<Slice>& slices, const Tensor& src);

bool allclose(const Tensor& a, const Tensor& b, double rtol = 1e-5, double atol = 1e-8);

} // namespace dg
