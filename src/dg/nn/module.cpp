#include "dg/nn/module.hpp"

#include <stdexcept>
#include <unordered_set>

namespace dg::nn {

std::vector<Variable*> Module::parameters() {
  std::vector<Variable*> out;
  std::unordered_set<const Node*> seen;
  for (auto& [name, p] : named_parameters()) {
    if (p && seen.insert(p->n.get()).second) out.push_back(p);
  }
  return out;
}

std::vector<std::pair<std::string, Variable*>> Module::named_parameters(const std::string& prefix) {
  std::vector<std::pair<std::string, Variable*>> out;
  auto join = [&](const std::string& name) {
    return prefix.empty() ? name : prefix + "." + name;
  };

  for (auto& [name, p] : named_params_) {
    if (p) out.emplace_back(join(name), p);
  }

  for (auto& [cname, child] : children_) {
    auto child_named = child->named_parameters(join(cname));
    out.insert(out.end(), child_named.begin(), child_named.end());
  }
  return out;
}

void Module::cleargrads() {
  for (auto* p : parameters()) p->cleargrad();
}

Module& Module::register_module(const std::string& name, Module& m) {
  if (name.empty() || name.find('.') != std::string::npos)
    throw std::invalid_argument("register_module: invalid name '" + name + "'");
  if (&m == this) throw std::invalid_argument("register_module: module cannot contain itself");
  children_.emplace_back(name, &m);
  return m;
}

std::shared_ptr<Module> Module::register_module(const std::string& name, std::shared_ptr<Module> m) {
  if (!m) throw std::invalid_argument("register_module: null module '" + name + "'");
  register_module(name, *m);
  owned_.push_back(m);
  return m;
}

Module& Module::register_parameter(const std::string& name, Variable& v) {
  if (name.empty() || name.find('.') != std::string::npos)
    throw std::invalid_argument("register_parameter: invalid name '" + name + "'");
  named_params_.emplace_back(name, &v);
  return *this;
}

} // namespace dg::nn
