#pragma once
#include "dg/core/variable.hpp"

namespace dg {

Variable sigmoid(const Variable& x);
Variable relu(const Variable& x);
// Numerically stable softmax along `axis`.
Variable softmax(const Variable& x, int axis = 1);

} // namespace dg
