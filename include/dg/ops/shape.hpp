#pragma once
#include <vector>

#include "dg/core/variable.hpp"

namespace dg {

// Returns x itself when the shape already matches.
Variable reshape(const Variable& x, const Shape& shape);
// Permutes axes; an empty list reverses them.
Variable transpose(const Variable& x, const std::vector<int>& axes = {});

} // namespace dg
