#include "dg/core/variable.hpp"
#include "dg/core/config.hpp"
#include "dg/core/function.hpp"
#include "dg/core/log.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/reduce.hpp"
#include "dg/ops/shape.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace dg {
using detail::shape_str;

Variable::Variable() : n(std::make_shared<Node>()) { retain(); }

Variable::Variable(Tensor data, std::string name) : n(std::make_shared<Node>()) {
  n->data = std::move(data);
  n->name = std::move(name);
  retain();
}

Variable::Variable(std::shared_ptr<Node> node) : n(std::move(node)) {
  if (!n) throw std::logic_error("Variable: null node");
  retain();
}

Variable::Variable(const Variable& o) : n(o.n) { retain(); }

Variable& Variable::operator=(const Variable& o) {
  Variable tmp(o);
  std::swap(n, tmp.n);
  return *this;
}

Variable& Variable::operator=(Variable&& o) noexcept {
  if (this != &o) {
    release();
    n = std::move(o.n);
  }
  return *this;
}

void Variable::release() noexcept {
  if (n && --n->handles == 0) n->grad.reset();
}

const Tensor& Variable::data() const {
  if (!n->data.defined()) {
    throw std::logic_error("Variable" + (n->name.empty() ? std::string() : " '" + n->name + "'") +
                           " has no data");
  }
  return n->data;
}

void Variable::set_data(Tensor t) { n->data = std::move(t); }

Variable Variable::grad() const {
  if (!n->grad) throw std::logic_error("grad: variable has no gradient");
  return Variable(n->grad);
}

void Variable::set_grad(const Variable& g) {
  if (!g.n) { n->grad.reset(); return; }
  if (n->data.defined() && g.shape() != n->data.shape())
    throw std::invalid_argument("set_grad: gradient shape " + shape_str(g.shape()) +
                                " does not match data shape " + shape_str(n->data.shape()));
  n->grad = g.n;
}

void Variable::set_creator(const std::shared_ptr<Function>& f) {
  n->creator = f;
  n->generation = f ? f->generation() + 1 : 0;
}

void Variable::unchain_backward() {
  std::vector<std::shared_ptr<Node>> stack{n};
  std::unordered_set<const Function*> seen;
  while (!stack.empty()) {
    auto node = std::move(stack.back());
    stack.pop_back();
    auto f = std::move(node->creator);
    node->creator.reset();
    if (!f || !seen.insert(f.get()).second) continue;
    for (auto& x : f->inputs()) stack.push_back(x.n);
  }
}

void Variable::backward(bool retain_grad, bool create_graph) {
  DG_BENCH("backward");
  if (!n->data.defined()) throw std::logic_error("backward: variable has no data");
  if (!n->grad) n->grad = Variable(Tensor::ones_like(n->data)).n;

  // Kept sorted by generation; ties keep insertion order.
  std::vector<std::shared_ptr<Function>> funcs;
  std::unordered_set<const Function*> seen;
  auto add_func = [&](const std::shared_ptr<Function>& f) {
    if (!seen.insert(f.get()).second) return;
    auto pos = std::upper_bound(funcs.begin(), funcs.end(), f->generation(),
                                [](int g, const std::shared_ptr<Function>& e) {
                                  return g < e->generation();
                                });
    funcs.insert(pos, f);
  };
  if (n->creator) add_func(n->creator);

  // Keeps every node that received a gradient reachable by a handle until
  // the sweep ends; otherwise a node only the graph owns would lose it.
  std::vector<Variable> pinned;
  std::size_t steps = 0;
  while (!funcs.empty()) {
    auto f = std::move(funcs.back());
    funcs.pop_back();
    ++steps;

    const auto outs = f->outputs();
    const auto& shapes = f->output_shapes();
    std::vector<Variable> gys;
    gys.reserve(outs.size());
    for (std::size_t i = 0; i < outs.size(); ++i) {
      if (outs[i].n && outs[i].has_grad()) gys.push_back(outs[i].grad());
      else gys.emplace_back(Tensor::zeros(shapes[i]));
    }

    const auto xs = f->inputs();
    pinned.insert(pinned.end(), xs.begin(), xs.end());
    {
      UsingConfig mode(ConfigFlag::EnableBackprop, create_graph);
      const auto gxs = f->backward(gys);
      if (gxs.size() != xs.size())
        throw std::logic_error(std::string(f->name()) + ": backward returned " +
                               std::to_string(gxs.size()) + " gradients for " +
                               std::to_string(xs.size()) + " inputs");

      for (std::size_t i = 0; i < xs.size(); ++i) {
        const Variable& x = xs[i];
        const Variable& gx = gxs[i];
        if (!gx.n || !gx.n->data.defined()) continue;
        if (gx.shape() != x.n->data.shape())
          throw std::logic_error(std::string(f->name()) + ": gradient shape " +
                                 shape_str(gx.shape()) + " does not match input shape " +
                                 shape_str(x.n->data.shape()));
        if (!x.n->grad) x.n->grad = gx.n;
        else x.n->grad = (Variable(x.n->grad) + gx).n;

        if (const auto& c = x.creator()) {
          if (c->generation() >= f->generation())
            throw std::logic_error(std::string(f->name()) + ": input creator " + c->name() +
                                   " has generation " + std::to_string(c->generation()) +
                                   ", expected below " + std::to_string(f->generation()));
          add_func(c);
        }
      }
    }

    DG_LOG(Debug, "backward %s gen=%d", f->name(), f->generation());

    if (!retain_grad) {
      for (const auto& y : outs) {
        if (y.n && y.n != n) y.n->grad.reset();
      }
    }
  }
  DG_LOG(Info, "backward: %zu functions visited", steps);
}

Variable Variable::reshape(const Shape& shape) const { return dg::reshape(*this, shape); }
Variable Variable::transpose(const std::vector<int>& axes) const { return dg::transpose(*this, axes); }
Variable Variable::T() const { return dg::transpose(*this, {}); }
Variable Variable::sum(const std::vector<int>& axes, bool keepdims) const {
  return dg::sum(*this, axes, keepdims);
}

} // namespace dg
