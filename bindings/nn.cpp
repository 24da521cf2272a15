#include <memory>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "sg/all.hpp"

namespace py = pybind11;

namespace {

// Width-1 results come back as a bare Value, wider ones as a list.
py::object unwrap(std::vector<sg::Value> out) {
  if (out.size() == 1) return py::cast(out.front());
  return py::cast(std::move(out));
}

} // namespace

void bind_nn(py::module_ &m) {
  auto nn = m.def_submodule("nn", "Neuron, Layer and MLP built on scalar nodes");

  py::class_<sg::nn::Module, std::shared_ptr<sg::nn::Module>>(nn, "Module")
    .def("parameters", &sg::nn::Module::parameters)
    .def("named_parameters", &sg::nn::Module::named_parameters, py::arg("prefix") = "")
    .def("zero_grad", &sg::nn::Module::zero_grad)
    .def("__call__", [](sg::nn::Module& self, const std::vector<sg::Value>& x){
      return unwrap(self.forward(x));
    })
    .def("__repr__", &sg::nn::Module::repr);

  py::class_<sg::nn::Neuron, sg::nn::Module, std::shared_ptr<sg::nn::Neuron>>(nn, "Neuron")
    .def(py::init([](std::size_t nin){ return std::make_shared<sg::nn::Neuron>(nin); }),
         py::arg("nin"))
    .def(py::init([](std::vector<sg::Value> w, sg::Value b){
      return std::make_shared<sg::nn::Neuron>(std::move(w), std::move(b));
    }), py::arg("weights"), py::arg("bias"))
    .def_property_readonly("w", &sg::nn::Neuron::weights)
    .def_property_readonly("b", &sg::nn::Neuron::bias);

  py::class_<sg::nn::Layer, sg::nn::Module, std::shared_ptr<sg::nn::Layer>>(nn, "Layer")
    .def(py::init([](std::size_t nin, std::size_t nout){
      return std::make_shared<sg::nn::Layer>(nin, nout);
    }), py::arg("nin"), py::arg("nout"))
    .def_property_readonly("neurons", &sg::nn::Layer::neurons);

  py::class_<sg::nn::MLP, sg::nn::Module, std::shared_ptr<sg::nn::MLP>>(nn, "MLP")
    .def(py::init([](std::size_t nin, const std::vector<std::size_t>& nouts){
      return std::make_shared<sg::nn::MLP>(nin, nouts);
    }), py::arg("nin"), py::arg("nouts"))
    .def_property_readonly("layers", &sg::nn::MLP::layers);

  // top-level aliases, matching `from scalargrad import MLP`
  m.attr("Neuron") = nn.attr("Neuron");
  m.attr("Layer")  = nn.attr("Layer");
  m.attr("MLP")    = nn.attr("MLP");
}
