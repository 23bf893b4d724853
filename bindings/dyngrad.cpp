// pybind11 bindings for dg::Tensor / dg::Variable and the operation library.
#include <memory>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "dg/all.hpp"
#include "dg/parallel/config.hpp"

namespace py = pybind11;

#ifndef DG_BINDINGS_VERSION
#define DG_BINDINGS_VERSION "0.1.0"
#endif

namespace {

using NumpyArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

dg::Tensor tensor_from_numpy(const NumpyArray& arr) {
  py::buffer_info info = arr.request();
  const double* p = static_cast<const double*>(info.ptr);
  std::vector<double> data(p, p + info.size);
  dg::Shape shape(info.shape.begin(), info.shape.end());
  if (shape.empty()) shape = {1};
  return dg::Tensor(std::move(data), std::move(shape));
}

py::array_t<double> tensor_to_numpy(const dg::Tensor& t) {
  if (!t.defined()) throw std::logic_error("tensor has no data");
  py::array_t<double> out(t.shape());
  std::copy(t.data().begin(), t.data().end(), out.mutable_data());
  return out;
}

// Accepts Variable, Tensor, ndarray or a Python number; anything else is a TypeError.
dg::Variable as_variable(const py::handle& h) {
  if (py::isinstance<dg::Variable>(h)) return h.cast<dg::Variable>();
  if (py::isinstance<dg::Tensor>(h)) return dg::Variable(h.cast<dg::Tensor>());
  if (py::isinstance<py::array>(h) || py::isinstance<py::float_>(h) || py::isinstance<py::int_>(h))
    return dg::Variable(tensor_from_numpy(NumpyArray::ensure(h)));
  throw py::type_error(std::string("expected Variable, Tensor or ndarray, got ") +
                       std::string(py::str(py::type::of(h))));
}

std::vector<dg::Slice> to_slices(const py::handle& idx, const dg::Shape& shape) {
  auto one = [&](const py::handle& it, std::size_t dim) -> dg::Slice {
    if (py::isinstance<py::int_>(it)) return dg::Slice::index(it.cast<long long>());
    if (py::isinstance<py::slice>(it)) {
      if (dim >= shape.size()) throw py::index_error("too many indices");
      py::ssize_t start, stop, step, len;
      if (!it.cast<py::slice>().compute(shape[dim], &start, &stop, &step, &len))
        throw py::error_already_set();
      if (step <= 0) throw std::invalid_argument("slice step must be positive");
      return dg::Slice::range(start, stop, step);
    }
    if (py::isinstance<py::list>(it) || py::isinstance<py::array>(it))
      return dg::Slice::take(it.cast<std::vector<long long>>());
    throw py::type_error("unsupported index type");
  };
  std::vector<dg::Slice> slices;
  if (py::isinstance<py::tuple>(idx)) {
    std::size_t d = 0;
    for (auto it : idx.cast<py::tuple>()) slices.push_back(one(it, d++));
  } else {
    slices.push_back(one(idx, 0));
  }
  return slices;
}

dg::Pair to_pair(const py::handle& h) {
  if (py::isinstance<py::int_>(h)) {
    const auto v = h.cast<std::size_t>();
    return {v, v};
  }
  auto v = h.cast<std::vector<std::size_t>>();
  if (v.size() != 2) throw std::invalid_argument("expected an int or a pair");
  return {v[0], v[1]};
}

// Context managers so `with dg.no_grad():` / `with dg.eval_mode():` work.
template <class Guard>
struct PyGuardCtx {
  std::unique_ptr<Guard> guard;
  PyGuardCtx& enter() { guard = std::make_unique<Guard>(); return *this; }
  void exit(py::object, py::object, py::object) { guard.reset(); }
};

} // namespace

PYBIND11_MODULE(dyngrad_py, m) {
  m.attr("__version__") = DG_BINDINGS_VERSION;

  // --- Modes ---
  m.def("is_grad_enabled", &dg::is_grad_enabled);
  m.def("set_grad_enabled", &dg::set_grad_enabled, py::arg("enabled"));
  m.def("is_training", &dg::is_training);
  m.def("set_training", &dg::set_training, py::arg("train"));

  py::class_<PyGuardCtx<dg::NoGradGuard>>(m, "no_grad")
    .def(py::init<>())
    .def("__enter__", &PyGuardCtx<dg::NoGradGuard>::enter, py::return_value_policy::reference_internal)
    .def("__exit__", &PyGuardCtx<dg::NoGradGuard>::exit);

  py::class_<PyGuardCtx<dg::EvalModeGuard>>(m, "eval_mode")
    .def(py::init<>())
    .def("__enter__", &PyGuardCtx<dg::EvalModeGuard>::enter, py::return_value_policy::reference_internal)
    .def("__exit__", &PyGuardCtx<dg::EvalModeGuard>::exit);

  // --- Tensor ---
  py::class_<dg::Tensor>(m, "Tensor")
    .def(py::init(&tensor_from_numpy), py::arg("array"))
    .def("numpy", &tensor_to_numpy)
    .def_property_readonly("shape", &dg::Tensor::shape)
    .def("__repr__", [](const dg::Tensor& t) {
      return "Tensor(shape=" + dg::detail::shape_str(t.shape()) + ")";
    });

  // --- Variable ---
  py::class_<dg::Variable>(m, "Variable")
    .def(py::init([](py::object data, std::string name) {
           if (data.is_none()) return dg::Variable();
           if (!py::isinstance<py::array>(data) && !py::isinstance<dg::Tensor>(data))
             throw py::type_error(std::string("Variable data must be an ndarray, got ") +
                                  std::string(py::str(py::type::of(data))));
           dg::Variable v = as_variable(data);
           v.set_name(std::move(name));
           return v;
         }),
         py::arg("data") = py::none(), py::arg("name") = std::string())
    .def_property("data",
                  [](const dg::Variable& v) { return tensor_to_numpy(v.data()); },
                  [](dg::Variable& v, const NumpyArray& a) { v.set_data(tensor_from_numpy(a)); })
    .def_property_readonly("grad", [](const dg::Variable& v) -> py::object {
      if (!v.has_grad()) return py::none();
      return py::cast(v.grad());
    })
    .def_property("name", &dg::Variable::name, &dg::Variable::set_name)
    .def_property_readonly("shape", &dg::Variable::shape)
    .def_property_readonly("ndim", &dg::Variable::ndim)
    .def_property_readonly("size", &dg::Variable::size)
    .def_property_readonly("generation", &dg::Variable::generation)
    .def_property_readonly("creator_name", [](const dg::Variable& v) -> py::object {
      if (!v.creator()) return py::none();
      return py::str(v.creator()->name());
    })
    .def("__len__", [](const dg::Variable& v) { return v.shape().front(); })
    .def("item", &dg::Variable::item)
    .def("backward", &dg::Variable::backward,
         py::arg("retain_grad") = false, py::arg("create_graph") = false)
    .def("cleargrad", &dg::Variable::cleargrad)
    .def("unchain", &dg::Variable::unchain)
    .def("unchain_backward", &dg::Variable::unchain_backward)
    .def("reshape", &dg::Variable::reshape, py::arg("shape"))
    .def("transpose", &dg::Variable::transpose, py::arg("axes") = std::vector<int>{})
    .def_property_readonly("T", &dg::Variable::T)
    .def("sum", &dg::Variable::sum, py::arg("axes") = std::vector<int>{}, py::arg("keepdims") = false)
    .def("__getitem__", [](const dg::Variable& v, py::object idx) {
      return dg::get_item(v, to_slices(idx, v.shape()));
    })
    .def("__add__",  [](const dg::Variable& a, py::object b) { return dg::add(a, as_variable(b)); })
    .def("__radd__", [](const dg::Variable& a, py::object b) { return dg::add(a, as_variable(b)); })
    .def("__sub__",  [](const dg::Variable& a, py::object b) { return dg::sub(a, as_variable(b)); })
    .def("__rsub__", [](const dg::Variable& a, py::object b) { return dg::rsub(a, as_variable(b)); })
    .def("__mul__",  [](const dg::Variable& a, py::object b) { return dg::mul(a, as_variable(b)); })
    .def("__rmul__", [](const dg::Variable& a, py::object b) { return dg::mul(a, as_variable(b)); })
    .def("__truediv__",  [](const dg::Variable& a, py::object b) { return dg::div(a, as_variable(b)); })
    .def("__rtruediv__", [](const dg::Variable& a, py::object b) { return dg::rdiv(a, as_variable(b)); })
    .def("__neg__", [](const dg::Variable& a) { return dg::neg(a); })
    .def("__pow__", [](const dg::Variable& a, double c) { return dg::pow(a, c); })
    .def("__matmul__", [](const dg::Variable& a, const dg::Variable& b) { return dg::matmul(a, b); })
    .def("__repr__", [](const dg::Variable& v) {
      if (!v.defined()) return std::string("variable(None)");
      return "variable(shape=" + dg::detail::shape_str(v.shape()) + ")";
    });

  py::implicitly_convertible<dg::Tensor, dg::Variable>();

  // --- Elementwise ---
  m.def("add", [](py::object a, py::object b) { return dg::add(as_variable(a), as_variable(b)); });
  m.def("sub", [](py::object a, py::object b) { return dg::sub(as_variable(a), as_variable(b)); });
  m.def("mul", [](py::object a, py::object b) { return dg::mul(as_variable(a), as_variable(b)); });
  m.def("div", [](py::object a, py::object b) { return dg::div(as_variable(a), as_variable(b)); });
  m.def("neg", [](const dg::Variable& x) { return dg::neg(x); }, py::arg("x"));
  m.def("pow", [](const dg::Variable& x, double c) { return dg::pow(x, c); }, py::arg("x"), py::arg("c"));
  m.def("square", [](const dg::Variable& x) { return dg::square(x); }, py::arg("x"));
  m.def("exp", [](const dg::Variable& x) { return dg::exp(x); }, py::arg("x"));
  m.def("log", [](const dg::Variable& x) { return dg::log(x); }, py::arg("x"));
  m.def("sin", [](const dg::Variable& x) { return dg::sin(x); }, py::arg("x"));
  m.def("cos", [](const dg::Variable& x) { return dg::cos(x); }, py::arg("x"));
  m.def("tanh", [](const dg::Variable& x) { return dg::tanh(x); }, py::arg("x"));

  // --- Shape / reduce ---
  m.def("reshape", &dg::reshape, py::arg("x"), py::arg("shape"));
  m.def("transpose", &dg::transpose, py::arg("x"), py::arg("axes") = std::vector<int>{});
  m.def("sum", &dg::sum, py::arg("x"), py::arg("axes") = std::vector<int>{}, py::arg("keepdims") = false);
  m.def("broadcast_to", &dg::broadcast_to, py::arg("x"), py::arg("shape"));
  m.def("sum_to", &dg::sum_to, py::arg("x"), py::arg("shape"));
  m.def("max", &dg::max, py::arg("x"), py::arg("axes") = std::vector<int>{}, py::arg("keepdims") = false);
  m.def("min", &dg::min, py::arg("x"), py::arg("axes") = std::vector<int>{}, py::arg("keepdims") = false);
  m.def("mean", &dg::mean, py::arg("x"), py::arg("axes") = std::vector<int>{}, py::arg("keepdims") = false);

  // --- Linalg ---
  m.def("matmul", [](const dg::Variable& x, const dg::Variable& W) { return dg::matmul(x, W); },
        py::arg("x"), py::arg("W"));
  m.def("linear", [](const dg::Variable& x, const dg::Variable& W, py::object b) {
          return dg::linear(x, W, b.is_none() ? dg::Variable() : as_variable(b));
        }, py::arg("x"), py::arg("W"), py::arg("b") = py::none());

  // --- Activations / losses ---
  m.def("sigmoid", &dg::sigmoid, py::arg("x"));
  m.def("relu", &dg::relu, py::arg("x"));
  m.def("softmax", &dg::softmax, py::arg("x"), py::arg("axis") = 1);
  m.def("mean_squared_error", &dg::mean_squared_error, py::arg("x0"), py::arg("x1"));
  m.def("softmax_cross_entropy", [](const dg::Variable& x, py::object t) {
          return dg::softmax_cross_entropy(x, as_variable(t));
        }, py::arg("x"), py::arg("t"));
  m.def("dropout", &dg::dropout, py::arg("x"), py::arg("ratio") = 0.5, py::arg("seed") = 0);

  // --- Convolution / pooling ---
  m.def("get_conv_outsize", &dg::get_conv_outsize,
        py::arg("size"), py::arg("k"), py::arg("s"), py::arg("p"));
  m.def("get_deconv_outsize", &dg::get_deconv_outsize,
        py::arg("size"), py::arg("k"), py::arg("s"), py::arg("p"));
  m.def("conv2d", [](const dg::Variable& x, const dg::Variable& W, py::object b,
                     py::object stride, py::object pad) {
          return dg::conv2d(x, W, b.is_none() ? dg::Variable() : as_variable(b),
                            to_pair(stride), to_pair(pad));
        }, py::arg("x"), py::arg("W"), py::arg("b") = py::none(),
        py::arg("stride") = 1, py::arg("pad") = 0);
  m.def("deconv2d", [](const dg::Variable& x, const dg::Variable& W, py::object b,
                       py::object stride, py::object pad, py::object outsize) {
          std::optional<dg::Pair> out;
          if (!outsize.is_none()) out = to_pair(outsize);
          return dg::deconv2d(x, W, b.is_none() ? dg::Variable() : as_variable(b),
                              to_pair(stride), to_pair(pad), out);
        }, py::arg("x"), py::arg("W"), py::arg("b") = py::none(),
        py::arg("stride") = 1, py::arg("pad") = 0, py::arg("outsize") = py::none());
  m.def("pooling", [](const dg::Variable& x, py::object kernel, py::object stride, py::object pad) {
          return dg::pooling(x, to_pair(kernel), to_pair(stride), to_pair(pad));
        }, py::arg("x"), py::arg("kernel_size"), py::arg("stride") = 1, py::arg("pad") = 0);
  m.def("im2col", [](const dg::Variable& x, py::object kernel, py::object stride, py::object pad,
                     bool to_matrix) {
          return dg::im2col(x, to_pair(kernel), to_pair(stride), to_pair(pad), to_matrix);
        }, py::arg("x"), py::arg("kernel_size"), py::arg("stride") = 1, py::arg("pad") = 0,
        py::arg("to_matrix") = true);

  // --- Utilities ---
  m.def("set_max_threads", &dg::parallel::set_max_threads, py::arg("n"));
  m.def("get_max_threads", &dg::parallel::get_max_threads);
  m.def("numerical_diff", [](py::function f, const dg::Variable& x, double eps) {
          return tensor_to_numpy(dg::numerical_diff(
            [&](const dg::Variable& v) { return f(v).cast<dg::Variable>(); }, x, eps));
        }, py::arg("f"), py::arg("x"), py::arg("eps") = 1e-4);
  m.def("logsumexp", [](const NumpyArray& x, int axis) {
          return tensor_to_numpy(dg::logsumexp(tensor_from_numpy(x), axis));
        }, py::arg("x"), py::arg("axis") = 1);
}
