#include "dg/core/function.hpp"
#include "dg/core/config.hpp"
#include "dg/core/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace dg {

Function::~Function() {
  // Unlinks nodes and functions this one is the last owner of, one at a
  // time, so a long chain does not unwind through nested destructors.
  std::vector<std::shared_ptr<Node>> stack = std::move(inputs_);
  while (!stack.empty()) {
    std::shared_ptr<Node> node = std::move(stack.back());
    stack.pop_back();
    if (node.use_count() != 1) continue;
    if (node->grad) stack.push_back(std::move(node->grad));
    std::shared_ptr<Function> f = std::move(node->creator);
    if (f && f.use_count() == 1) {
      for (auto& x : f->inputs_) stack.push_back(std::move(x));
      f->inputs_.clear();
    }
  }
}

std::vector<Variable> Function::inputs() const {
  std::vector<Variable> out;
  out.reserve(inputs_.size());
  for (const auto& x : inputs_) out.emplace_back(x);
  return out;
}

std::vector<Variable> Function::outputs() const {
  std::vector<Variable> out;
  out.reserve(outputs_.size());
  for (const auto& w : outputs_) {
    if (auto y = w.lock()) out.emplace_back(std::move(y));
    else out.emplace_back();
  }
  return out;
}

Variable Function::input(std::size_t i) const {
  if (i >= inputs_.size())
    throw std::logic_error(std::string(name()) + ": input " + std::to_string(i) + " not recorded");
  return Variable(inputs_[i]);
}

Variable Function::output(std::size_t i) const {
  if (i >= outputs_.size())
    throw std::logic_error(std::string(name()) + ": output " + std::to_string(i) + " not recorded");
  if (auto y = outputs_[i].lock()) return Variable(std::move(y));
  return Variable();
}

std::vector<Variable> apply(const std::shared_ptr<Function>& f,
                            const std::vector<Variable>& inputs) {
  if (!f) throw std::invalid_argument("apply: null function");
  if (inputs.empty())
    throw std::invalid_argument(std::string(f->name()) + ": called with no inputs");
  if (f->applied_)
    throw std::logic_error(std::string(f->name()) +
                           ": instance already applied; construct a new one per call");
  f->applied_ = true;

  std::vector<Tensor> xs;
  xs.reserve(inputs.size());
  for (const auto& x : inputs) {
    if (!x.n) throw std::logic_error(std::string(f->name()) + ": null input handle");
    xs.push_back(x.n->data);
  }

  std::vector<Tensor> ys = f->forward(xs);
  if (ys.empty()) throw std::logic_error(std::string(f->name()) + ": forward produced no outputs");

  std::vector<Variable> outputs;
  outputs.reserve(ys.size());
  f->output_shapes_.clear();
  for (auto& y : ys) {
    if (!y.defined())
      throw std::logic_error(std::string(f->name()) + ": forward produced an undefined output");
    f->output_shapes_.push_back(y.shape());
    outputs.emplace_back(std::move(y));
  }

  if (is_grad_enabled()) {
    int gen = 0;
    for (const auto& x : inputs) gen = std::max(gen, x.generation());
    f->generation_ = gen;
    f->inputs_.clear();
    for (const auto& x : inputs) f->inputs_.push_back(x.n);
    f->outputs_.clear();
    for (auto& y : outputs) {
      y.set_creator(f);
      f->outputs_.push_back(y.n);
    }
    DG_LOG(Debug, "apply %s gen=%d inputs=%zu outputs=%zu", f->name(), gen,
           inputs.size(), outputs.size());
  }
  return outputs;
}

Variable apply_one(const std::shared_ptr<Function>& f, const std::vector<Variable>& inputs) {
  auto ys = apply(f, inputs);
  if (ys.size() != 1)
    throw std::logic_error(std::string(f->name()) + ": expected one output, got " +
                           std::to_string(ys.size()));
  return ys.front();
}

} // namespace dg
