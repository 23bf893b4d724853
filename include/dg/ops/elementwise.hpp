#pragma once
#include "dg/core/variable.hpp"

namespace dg {

// Elementwise (broadcasting). Gradients of broadcast operands are reduced
// back to the operand's own shape.
Variable add(const Variable& a, const Variable& b);
Variable sub(const Variable& a, const Variable& b);
Variable mul(const Variable& a, const Variable& b);
Variable div(const Variable& a, const Variable& b);
// b - a and b / a; used for `scalar - x` and `scalar / x`.
Variable rsub(const Variable& a, const Variable& b);
Variable rdiv(const Variable& a, const Variable& b);
Variable neg(const Variable& x);

// x ** c for a constant exponent.
Variable pow(const Variable& x, double c);
Variable square(const Variable& x);
Variable exp(const Variable& x);
Variable log(const Variable& x);
Variable sin(const Variable& x);
Variable cos(const Variable& x);
Variable tanh(const Variable& x);

Variable operator+(const Variable& a, const Variable& b);
Variable operator-(const Variable& a, const Variable& b);
Variable operator*(const Variable& a, const Variable& b);
Variable operator/(const Variable& a, const Variable& b);
Variable operator-(const Variable& x);

Variable operator+(const Variable& a, double s);
Variable operator-(const Variable& a, double s);
Variable operator*(const Variable& a, double s);
Variable operator/(const Variable& a, double s);
Variable operator+(double s, const Variable& a);
Variable operator-(double s, const Variable& a);
Variable operator*(double s, const Variable& a);
Variable operator/(double s, const Variable& a);

} // namespace dg
