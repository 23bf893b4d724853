#pragma once
#include <vector>

#include "dg/core/variable.hpp"

namespace dg {

// Sum over 'axes'. If axes is empty, reduce all dims. If keepdims=true, reduced
// axes are kept with size 1. A full reduction yields shape [1].
Variable sum(const Variable& x, const std::vector<int>& axes = {}, bool keepdims = false);

// Broadcast x to 'shape' (NumPy rules); backward is sum_to.
Variable broadcast_to(const Variable& x, const Shape& shape);

// Sum x down to 'shape' (leading axes and axes where shape has 1);
// backward is broadcast_to.
Variable sum_to(const Variable& x, const Shape& shape);

// Gradient flows to every position equal to the extremum.
Variable max(const Variable& x, const std::vector<int>& axes = {}, bool keepdims = false);
Variable min(const Variable& x, const std::vector<int>& axes = {}, bool keepdims = false);

Variable mean(const Variable& x, const std::vector<int>& axes = {}, bool keepdims = false);

} // namespace dg
