#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dg/core/tensor.hpp"

namespace dg {

class Function;

// Graph vertex. `data` is never written after the node is created;
// `grad` is replaced (never mutated in place) while gradients accumulate.
//
// A gradient recorded with create_graph points back at this node through
// its creator's inputs. `handles` counts live Variables (graph edges do not
// count); when the last one goes away the gradient is dropped, which breaks
// that ownership cycle.
struct Node {
  Tensor data;                          // may be undefined (absent input)
  std::shared_ptr<Node> grad;           // null until a gradient arrives
  std::shared_ptr<Function> creator;    // null for leaves
  int generation = 0;                   // 0 for leaves, creator gen + 1 otherwise
  std::string name;
  std::size_t handles = 0;
};

class Variable {
public:
  Variable();                                                  // leaf with absent data
  Variable(Tensor data, std::string name = {});                // wrap a raw value as a leaf
  explicit Variable(std::shared_ptr<Node> node);               // wrap existing

  Variable(const Variable& o);
  Variable(Variable&& o) noexcept : n(std::move(o.n)) {}
  Variable& operator=(const Variable& o);
  Variable& operator=(Variable&& o) noexcept;
  ~Variable() { release(); }

  bool defined() const { return n && n->data.defined(); }
  const Tensor& data() const;
  void set_data(Tensor t);
  const Shape& shape() const { return data().shape(); }
  std::size_t ndim() const { return data().ndim(); }
  std::size_t size() const { return data().size(); }
  double item() const { return data().item(); }

  const std::string& name() const { return n->name; }
  void set_name(std::string nm) { n->name = std::move(nm); }

  bool has_grad() const { return n->grad != nullptr; }
  Variable grad() const;                     // throws std::logic_error if absent
  void set_grad(const Variable& g);
  void cleargrad() { n->grad.reset(); }

  const std::shared_ptr<Function>& creator() const { return n->creator; }
  void set_creator(const std::shared_ptr<Function>& f);
  int generation() const { return n->generation; }

  // Drop the link to the creator; data is kept.
  void unchain() { n->creator.reset(); }
  // Unchain this node and every node reachable through creator links.
  void unchain_backward();

  // Reverse-mode sweep from this node. Seeds grad with ones when absent.
  // retain_grad keeps intermediate gradients; create_graph records the
  // backward computation so its result can be differentiated again.
  void backward(bool retain_grad = false, bool create_graph = false);

  Variable reshape(const Shape& shape) const;
  Variable transpose(const std::vector<int>& axes = {}) const;
  Variable T() const;
  Variable sum(const std::vector<int>& axes = {}, bool keepdims = false) const;

  bool same_node(const Variable& o) const { return n == o.n; }

  // expose node handle for ops implementation; reassign through Variable,
  // not directly, so the handle count stays right
  std::shared_ptr<Node> n;

private:
  void retain() { if (n) ++n->handles; }
  void release() noexcept;
};

} // namespace dg
