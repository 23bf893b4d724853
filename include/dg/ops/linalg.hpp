#pragma once
#include "dg/core/variable.hpp"

namespace dg {

// [M,K] @ [K,N] -> [M,N]
Variable matmul(const Variable& x, const Variable& W);

// x @ W + b. An undefined `b` means no bias; no gradient is produced for it.
Variable linear(const Variable& x, const Variable& W, const Variable& b = Variable());

} // namespace dg
