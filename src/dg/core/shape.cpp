#include "dg/core/shape.hpp"
#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace dg::detail {

std::size_t numel(const Shape& shp) {
  std::size_t n = 1;
  for (auto d : shp) n *= d;
  return n;
}

std::vector<std::size_t> strides_for(const Shape& shp) {
  std::vector<std::size_t> s(shp.size(), 1);
  for (std::size_t i = shp.size(); i-- > 1;) s[i - 1] = s[i] * shp[i];
  return s;
}

std::size_t ravel_index(const std::vector<std::size_t>& idx,
                        const std::vector<std::size_t>& strides) {
  std::size_t off = 0;
  for (std::size_t i = 0; i < idx.size(); ++i) off += idx[i] * strides[i];
  return off;
}

std::vector<std::size_t> unravel_index(std::size_t linear, const Shape& dims) {
  std::vector<std::size_t> idx(dims.size(), 0);
  for (std::size_t i = dims.size(); i-- > 0;) {
    const std::size_t d = dims[i] ? dims[i] : 1;
    idx[i] = linear % d;
    linear /= d;
  }
  return idx;
}

std::string shape_str(const Shape& shp) {
  std::ostringstream oss;
  oss << "(";
  for (std::size_t i = 0; i < shp.size(); ++i) {
    if (i) oss << ", ";
    oss << shp[i];
  }
  oss << ")";
  return oss.str();
}

Shape broadcast_two(const Shape& A, const Shape& B) {
  const std::size_t r = std::max(A.size(), B.size());
  Shape out(r, 1);
  for (std::size_t i = 0; i < r; ++i) {
    const std::size_t a = (i < r - A.size()) ? 1 : A[i - (r - A.size())];
    const std::size_t b = (i < r - B.size()) ? 1 : B[i - (r - B.size())];
    if (a != b && a != 1 && b != 1)
      throw std::invalid_argument("shapes " + shape_str(A) + " and " + shape_str(B) +
                                  " are not broadcastable");
    out[i] = (a == 1) ? b : a;
  }
  return out;
}

bool broadcastable_to(const Shape& from, const Shape& to) {
  if (from.size() > to.size()) return false;
  const std::size_t lead = to.size() - from.size();
  for (std::size_t i = 0; i < from.size(); ++i)
    if (from[i] != 1 && from[i] != to[lead + i]) return false;
  return true;
}

std::size_t map_aligned(const std::vector<std::size_t>& out_idx,
                        const Shape& out, const Shape& src,
                        const std::vector<std::size_t>& src_strides) {
  const std::size_t r = out.size();
  const std::size_t rs = src.size();
  std::size_t off = 0;
  for (std::size_t si = 0; si < rs; ++si) {
    if (src[si] == 1) continue;
    off += out_idx[si + (r - rs)] * src_strides[si];
  }
  return off;
}

std::vector<std::size_t> normalize_axes(const std::vector<int>& axes_in, std::size_t rank) {
  std::vector<std::size_t> axes;
  if (axes_in.empty()) {
    axes.resize(rank);
    std::iota(axes.begin(), axes.end(), std::size_t{0});
    return axes;
  }
  axes.reserve(axes_in.size());
  for (int ax : axes_in) {
    long a = ax;
    if (a < 0) a += long(rank);
    if (a < 0 || a >= long(rank))
      throw std::invalid_argument("axis " + std::to_string(ax) + " out of range for rank " +
                                  std::to_string(rank));
    axes.push_back(std::size_t(a));
  }
  std::sort(axes.begin(), axes.end());
  axes.erase(std::unique(axes.begin(), axes.end()), axes.end());
  return axes;
}

Shape reduced_shape(const Shape& in, const std::vector<std::size_t>& axes, bool keepdims) {
  if (keepdims) return keepdims_shape(in, axes);
  Shape s;
  s.reserve(in.size());
  std::size_t j = 0;
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (j < axes.size() && axes[j] == i) { ++j; continue; }
    s.push_back(in[i]);
  }
  if (s.empty()) s = {1}; // represent scalar as [1]
  return s;
}

Shape keepdims_shape(const Shape& in, const std::vector<std::size_t>& axes) {
  Shape s = in;
  for (auto a : axes) s[a] = 1;
  return s;
}

} // namespace dg::detail
