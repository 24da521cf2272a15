// value.cpp: pybind11 bindings for sg::Value and the scalar ops.
// bind_nn() in bindings/nn.cpp adds the network classes to the same module.
#include <sstream>
#include <string>
#include <utility>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "sg/all.hpp"

namespace py = pybind11;

void bind_nn(py::module_ &m);

#ifndef SG_BINDINGS_VERSION
#define SG_BINDINGS_VERSION "0.1.0"
#endif

using sg::Value;

PYBIND11_MODULE(scalargrad, m) {
  m.attr("__version__") = SG_BINDINGS_VERSION;

  py::register_exception<sg::InvalidExponentType>(m, "InvalidExponentType", PyExc_TypeError);
  py::register_exception<sg::DimensionMismatch>(m, "DimensionMismatch", PyExc_ValueError);

  m.def("manual_seed", &sg::manual_seed, py::arg("seed"),
        "Reseed the generator used for parameter initialization");

  py::class_<Value>(m, "Value")
    .def(py::init<double, std::string>(), py::arg("data"), py::arg("label") = "")
    .def_property("data", &Value::value, &Value::set_value)
    .def_property("grad", &Value::grad, [](Value& v, double g){ v.n->grad = g; })
    .def_property("label", &Value::label, [](Value& v, std::string s){ v.set_label(std::move(s)); })
    .def_property_readonly("op", &Value::op)
    .def_property_readonly("parents", &Value::parents)
    .def("backward", &Value::backward)
    .def("zero_grad", &Value::zero_grad)
    .def("exp",  &Value::exp)
    .def("tanh", &Value::tanh)
    .def("relu", &Value::relu)

    // arithmetic, node or number on either side
    .def("__add__",      [](const Value& a, const Value& b){ return a + b; }, py::is_operator())
    .def("__add__",      [](const Value& a, double b){ return a + b; }, py::is_operator())
    .def("__radd__",     [](const Value& a, double b){ return b + a; }, py::is_operator())
    .def("__sub__",      [](const Value& a, const Value& b){ return a - b; }, py::is_operator())
    .def("__sub__",      [](const Value& a, double b){ return a - b; }, py::is_operator())
    .def("__rsub__",     [](const Value& a, double b){ return b - a; }, py::is_operator())
    .def("__mul__",      [](const Value& a, const Value& b){ return a * b; }, py::is_operator())
    .def("__mul__",      [](const Value& a, double b){ return a * b; }, py::is_operator())
    .def("__rmul__",     [](const Value& a, double b){ return b * a; }, py::is_operator())
    .def("__truediv__",  [](const Value& a, const Value& b){ return a / b; }, py::is_operator())
    .def("__truediv__",  [](const Value& a, double b){ return a / b; }, py::is_operator())
    .def("__rtruediv__", [](const Value& a, double b){ return b / a; }, py::is_operator())
    .def("__pow__",      [](const Value& a, double k){ return sg::pow(a, k); }, py::is_operator())
    // node exponents are rejected with InvalidExponentType
    .def("__pow__",      [](const Value& a, const Value& k){ return sg::pow(a, k); }, py::is_operator())
    .def("__neg__",      [](const Value& a){ return -a; })
    .def("__abs__",      [](const Value& a){ return a.abs(); })
    .def("__gt__",       [](const Value& a, const Value& b){ return a > b; }, py::is_operator())
    .def("__gt__",       [](const Value& a, double b){ return a > b; }, py::is_operator())
    .def("__lt__",       [](const Value& a, const Value& b){ return a < b; }, py::is_operator())
    .def("__lt__",       [](const Value& a, double b){ return a < b; }, py::is_operator())
    .def("__repr__", [](const Value& v){
      std::ostringstream oss;
      oss << v;
      return oss.str();
    });

  py::implicitly_convertible<py::float_, Value>();
  py::implicitly_convertible<py::int_, Value>();

  m.def("exp",  [](const Value& x){ return sg::expv(x); },  py::arg("x"));
  m.def("tanh", [](const Value& x){ return sg::tanhv(x); }, py::arg("x"));
  m.def("relu", [](const Value& x){ return sg::relu(x); },  py::arg("x"));
  m.def("backward", [](const Value& root){ sg::backward(root); }, py::arg("root"));

  bind_nn(m);
}
