#include "dg/ops/numeric.hpp"
#include "dg/core/config.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/reduce.hpp"


namespace dg {

Tensor numerical_diff(const UnaryFn& f, const Variable& x, double eps) {
  NoGradGuard no_grad;
  const Tensor& xd = x.data();
  const Tensor y0 = f(Variable(xd - eps)).data();
  const Tensor y1 = f(Variable(xd + eps)).data();
  return (y1 - y0) / (2.0 * eps);
}

Tensor numerical_grad(const UnaryFn& f, const Variable& x, double eps) {
  NoGradGuard no_grad;
  const Tensor& xd = x.data();
  std::vector<double> point = xd.data();
  std::vector<double> g(point.size());
  auto eval = [&]() {
    return f(Variable(Tensor(point, xd.shape()))).data().sum().item();
  };
  for (std::size_t i = 0; i < point.size(); ++i) {
    const double orig = point[i];
    point[i] = orig + eps;
    const double fp = eval();
    point[i] = orig - eps;
    const double fm = eval();
    point[i] = orig;
    g[i] = (fp - fm) / (2.0 * eps);
  }
  return Tensor(std::move(g), xd.shape());
}

Tensor logsumexp(const Tensor& x, int axis) {
  const Tensor m = x.max({axis}, true);
  const Tensor s = exp(x - m).sum({axis}, true);
  return log(s) + m;
}

Variable sphere(const Variable& x, const Variable& y) {
  return pow(x, 2.0) + pow(y, 2.0);
}

Variable matyas(const Variable& x, const Variable& y) {
  return 0.26 * (pow(x, 2.0) + pow(y, 2.0)) - 0.48 * x * y;
}

Variable goldstein(const Variable& x, const Variable& y) {
  return (1.0 + pow(x + y + 1.0, 2.0) *
                    (19.0 - 14.0 * x + 3.0 * pow(x, 2.0) - 14.0 * y + 6.0 * x * y +
                     3.0 * pow(y, 2.0))) *
         (30.0 + pow(2.0 * x - 3.0 * y, 2.0) *
                     (18.0 - 32.0 * x + 12.0 * pow(x, 2.0) + 48.0 * y - 36.0 * x * y +
                      27.0 * pow(y, 2.0)));
}

Variable rosenbrock(const Variable& x0, const Variable& x1) {
  return 100.0 * pow(x1 - pow(x0, 2.0), 2.0) + pow(x0 - 1.0, 2.0);
}

} // namespace dg
