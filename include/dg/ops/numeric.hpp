#pragma once
#include <functional>

#include "dg/core/variable.hpp"

namespace dg {

using UnaryFn = std::function<Variable(const Variable&)>;

// Central difference (f(x+eps) - f(x-eps)) / 2eps with x shifted as a whole.
Tensor numerical_diff(const UnaryFn& f, const Variable& x, double eps = 1e-4);

// Per-element central difference of sum(f(x)); same shape as x.
Tensor numerical_grad(const UnaryFn& f, const Variable& x, double eps = 1e-4);

// log(sum(exp(x), axis)) with keepdims, stabilised by the axis max.
Tensor logsumexp(const Tensor& x, int axis = 1);

// Optimisation benchmark surfaces.
Variable sphere(const Variable& x, const Variable& y);
Variable matyas(const Variable& x, const Variable& y);
Variable goldstein(const Variable& x, const Variable& y);
Variable rosenbrock(const Variable& x0, const Variable& x1);

} // namespace dg
