#include "dg/ops/elementwise.hpp"
#include "dg/core/function.hpp"
#include "dg/ops/reduce.hpp"

namespace dg {
namespace {

// Reduce a raw operand gradient to the operand's own shape when the two
// operands were broadcast against each other.
struct BinaryShapes {
  Shape x0, x1;
  void record(const std::vector<Tensor>& xs) { x0 = xs[0].shape(); x1 = xs[1].shape(); }
  std::vector<Variable> reduce(Variable g0, Variable g1) const {
    if (x0 != x1) {
      if (g0.n) g0 = sum_to(g0, x0);
      if (g1.n) g1 = sum_to(g1, x1);
    }
    return {g0, g1};
  }
};

class Add final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    shapes_.record(xs);
    return {xs[0] + xs[1]};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return shapes_.reduce(gys[0], gys[0]);
  }
  const char* name() const override { return "Add"; }
private:
  BinaryShapes shapes_;
};

class Sub final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    shapes_.record(xs);
    return {xs[0] - xs[1]};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return shapes_.reduce(gys[0], -gys[0]);
  }
  const char* name() const override { return "Sub"; }
private:
  BinaryShapes shapes_;
};

class Mul final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    shapes_.record(xs);
    return {xs[0] * xs[1]};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable x0 = input(0), x1 = input(1);
    return shapes_.reduce(gys[0] * x1, gys[0] * x0);
  }
  const char* name() const override { return "Mul"; }
private:
  BinaryShapes shapes_;
};

class Div final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    shapes_.record(xs);
    return {xs[0] / xs[1]};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable x0 = input(0), x1 = input(1);
    const Variable& gy = gys[0];
    return shapes_.reduce(gy / x1, gy * (-x0 / (x1 * x1)));
  }
  const char* name() const override { return "Div"; }
private:
  BinaryShapes shapes_;
};

class Neg final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override { return {-xs[0]}; }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override { return {-gys[0]}; }
  const char* name() const override { return "Neg"; }
};

class Pow final : public Function {
public:
  explicit Pow(double c) : c_(c) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override { return {dg::pow(xs[0], c_)}; }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {c_ * pow(input(0), c_ - 1.0) * gys[0]};
  }
  const char* name() const override { return "Pow"; }
private:
  double c_;
};

class Square final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override { return {xs[0] * xs[0]}; }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {2.0 * input(0) * gys[0]};
  }
  const char* name() const override { return "Square"; }
};

class Exp final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override { return {dg::exp(xs[0])}; }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    Variable y = output(0);
    if (!y.defined()) y = exp(input(0));
    return {gys[0] * y};
  }
  const char* name() const override { return "Exp"; }
};

class Log final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override { return {dg::log(xs[0])}; }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {gys[0] / input(0)};
  }
  const char* name() const override { return "Log"; }
};

class Sin final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override { return {dg::sin(xs[0])}; }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {gys[0] * cos(input(0))};
  }
  const char* name() const override { return "Sin"; }
};

class Cos final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override { return {dg::cos(xs[0])}; }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {gys[0] * -sin(input(0))};
  }
  const char* name() const override { return "Cos"; }
};

class Tanh final : public Function {
public:
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override { return {dg::tanh(xs[0])}; }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    Variable y = output(0);
    if (!y.defined()) y = tanh(input(0));
    return {gys[0] * (1.0 - y * y)};
  }
  const char* name() const override { return "Tanh"; }
};

Variable constant(double s) { return Variable(Tensor::scalar(s)); }

} // namespace

Variable add(const Variable& a, const Variable& b) { return call<Add>({a, b}); }
Variable sub(const Variable& a, const Variable& b) { return call<Sub>({a, b}); }
Variable mul(const Variable& a, const Variable& b) { return call<Mul>({a, b}); }
Variable div(const Variable& a, const Variable& b) { return call<Div>({a, b}); }
Variable rsub(const Variable& a, const Variable& b) { return call<Sub>({b, a}); }
Variable rdiv(const Variable& a, const Variable& b) { return call<Div>({b, a}); }
Variable neg(const Variable& x) { return call<Neg>({x}); }

Variable pow(const Variable& x, double c) { return call<Pow>({x}, c); }
Variable square(const Variable& x) { return call<Square>({x}); }
Variable exp(const Variable& x) { return call<Exp>({x}); }
Variable log(const Variable& x) { return call<Log>({x}); }
Variable sin(const Variable& x) { return call<Sin>({x}); }
Variable cos(const Variable& x) { return call<Cos>({x}); }
Variable tanh(const Variable& x) { return call<Tanh>({x}); }

Variable operator+(const Variable& a, const Variable& b) { return add(a, b); }
Variable operator-(const Variable& a, const Variable& b) { return sub(a, b); }
Variable operator*(const Variable& a, const Variable& b) { return mul(a, b); }
Variable operator/(const Variable& a, const Variable& b) { return div(a, b); }
Variable operator-(const Variable& x) { return neg(x); }

Variable operator+(const Variable& a, double s) { return add(a, constant(s)); }
Variable operator-(const Variable& a, double s) { return sub(a, constant(s)); }
Variable operator*(const Variable& a, double s) { return mul(a, constant(s)); }
Variable operator/(const Variable& a, double s) { return div(a, constant(s)); }
Variable operator+(double s, const Variable& a) { return add(a, constant(s)); }
Variable operator-(double s, const Variable& a) { return rsub(a, constant(s)); }
Variable operator*(double s, const Variable& a) { return mul(a, constant(s)); }
Variable operator/(double s, const Variable& a) { return rdiv(a, constant(s)); }

} // namespace dg
