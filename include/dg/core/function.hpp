#pragma once
#include <memory>
#include <utility>
#include <vector>

#include "dg/core/tensor.hpp"
#include "dg/core/variable.hpp"

namespace dg {

// One recorded invocation of an operation.
//
// forward() maps raw input buffers to raw output buffers. backward() maps
// output gradients to input gradients and is written with Variables, so
// when it runs with recording enabled the backward pass is itself traced
// (higher-order gradients). Returning an undefined Variable for an input
// means "no gradient for this input".
//
// Instances are single use: construct a fresh one per call. Inputs are
// owned; outputs are observed through weak references so dropping an
// output never keeps its producer alive and no cycle is formed.
class Function : public std::enable_shared_from_this<Function> {
public:
  // Releases the inputs without recursing through long chains.
  virtual ~Function();

  virtual std::vector<Tensor> forward(const std::vector<Tensor>& xs) = 0;
  virtual std::vector<Variable> backward(const std::vector<Variable>& gys) = 0;
  virtual const char* name() const = 0;

  int generation() const { return generation_; }
  std::vector<Variable> inputs() const;
  // Outputs that were already released come back as undefined Variables.
  std::vector<Variable> outputs() const;
  const std::vector<Shape>& output_shapes() const { return output_shapes_; }
  std::size_t num_inputs() const { return inputs_.size(); }
  std::size_t num_outputs() const { return outputs_.size(); }

protected:
  Variable input(std::size_t i) const;
  // Output i, or an undefined Variable if the caller already released it.
  Variable output(std::size_t i) const;

private:
  friend std::vector<Variable> apply(const std::shared_ptr<Function>& f,
                                     const std::vector<Variable>& inputs);

  std::vector<std::shared_ptr<Node>> inputs_;
  std::vector<std::weak_ptr<Node>> outputs_;
  std::vector<Shape> output_shapes_;
  int generation_ = 0;
  bool applied_ = false;
};

// Runs f on `inputs` and, when recording is enabled, wires creator links
// and generations. Raw Tensors convert to leaf Variables implicitly.
std::vector<Variable> apply(const std::shared_ptr<Function>& f,
                            const std::vector<Variable>& inputs);

// Single-output form of apply.
Variable apply_one(const std::shared_ptr<Function>& f, const std::vector<Variable>& inputs);

template <class F, class... Args>
Variable call(const std::vector<Variable>& inputs, Args&&... args) {
  return apply_one(std::make_shared<F>(std::forward<Args>(args)...), inputs);
}

} // namespace dg
