#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dg/core/variable.hpp"

namespace dg::nn {

// Base class for parameter containers.
// - Pure-virtual forward()
// - Named parameter registration + recursive collection
// - Named children; named_parameters() joins paths with '.'
//
// Copy/move are deleted so registered Variable*/Module* stay valid.
// Training-time behaviour is controlled globally (dg::EvalModeGuard).
class Module {
public:
  Module() = default;
  virtual ~Module() = default;

  Module(const Module&)            = delete;
  Module& operator=(const Module&) = delete;
  Module(Module&&)                 = delete;
  Module& operator=(Module&&)      = delete;

  virtual Variable forward(const Variable& x) = 0;
  Variable operator()(const Variable& x) { return forward(x); }

  // Own parameters first, then children in registration order; each graph
  // node appears once even if registered under several names or handles.
  std::vector<Variable*> parameters();
  std::vector<std::pair<std::string, Variable*>> named_parameters(const std::string& prefix = "");
  void cleargrads();

  // non-owning (member) child
  Module& register_module(const std::string& name, Module& m);
  // owning child
  std::shared_ptr<Module> register_module(const std::string& name, std::shared_ptr<Module> m);

  Module& register_parameter(const std::string& name, Variable& v);

private:
  std::vector<std::pair<std::string, Module*>> children_;
  std::vector<std::shared_ptr<Module>> owned_;
  std::vector<std::pair<std::string, Variable*>> named_params_;
};

} // namespace dg::nn
