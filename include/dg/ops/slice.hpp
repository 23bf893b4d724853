#pragma once
#include <vector>

#include "dg/core/variable.hpp"

namespace dg {

// x[slices]. Backward scatters into zeros shaped like x, accumulating on
// repeated positions.
Variable get_item(const Variable& x, const std::vector<Slice>& slices);

// Scatter-add of gy into zeros(in_shape) at slices; backward is get_item.
Variable get_item_grad(const Variable& gy, const std::vector<Slice>& slices, const Shape& in_shape);

} // namespace dg
