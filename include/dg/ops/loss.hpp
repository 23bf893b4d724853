#pragma once
#include "dg/core/variable.hpp"

namespace dg {

// sum((x0 - x1)^2) / len(x0), where len is the size of the first axis.
Variable mean_squared_error(const Variable& x0, const Variable& x1);

// x: [N, C] logits, t: [N] class indices (stored as doubles).
// Mean over the batch of -log softmax(x)[i, t[i]], computed via log-sum-exp.
Variable softmax_cross_entropy(const Variable& x, const Variable& t);

} // namespace dg
