#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace dg {

using Shape = std::vector<std::size_t>;

namespace detail {

// shape helpers
std::size_t numel(const Shape& shp);
std::vector<std::size_t> strides_for(const Shape& shp);
std::size_t ravel_index(const std::vector<std::size_t>& idx,
                        const std::vector<std::size_t>& strides);
std::vector<std::size_t> unravel_index(std::size_t linear, const Shape& dims);
std::string shape_str(const Shape& shp);

// broadcasting helpers (NumPy-style, right-aligned; 1 is wildcard)
Shape broadcast_two(const Shape& A, const Shape& B);
bool broadcastable_to(const Shape& from, const Shape& to);

// Flat offset into an operand of shape `src` (right-aligned against `out`)
// for the output multi-index `out_idx`; broadcast dims contribute 0.
std::size_t map_aligned(const std::vector<std::size_t>& out_idx,
                        const Shape& out, const Shape& src,
                        const std::vector<std::size_t>& src_strides);

// Reduction helpers. Empty `axes` means every axis; negative axes wrap.
// Result is sorted and de-duplicated.
std::vector<std::size_t> normalize_axes(const std::vector<int>& axes, std::size_t rank);
// Output shape of a reduction; a full reduction without keepdims is [1].
Shape reduced_shape(const Shape& in, const std::vector<std::size_t>& axes, bool keepdims);
// Same reduction with keepdims=true (reduced axes set to 1).
Shape keepdims_shape(const Shape& in, const std::vector<std::size_t>& axes);

} // namespace detail
} // namespace dg
