#include "scalarnet.hpp"

#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

using namespace pybind11::literals;
namespace py = pybind11;

void bind_errors(py::module &m) {
  auto &error = py::register_exception<scalarnet::Error>(m, "Error",
                                                         PyExc_RuntimeError);

  py::register_exception<scalarnet::WidthMismatchError>(
      m, "WidthMismatchError", error.ptr());
  py::register_exception<scalarnet::RegisterSpecError>(m, "RegisterSpecError",
                                                       error.ptr());
  py::register_exception<scalarnet::UnknownRegisterError>(
      m, "UnknownRegisterError", error.ptr());
  py::register_exception<scalarnet::InvalidWidthError>(
      m, "InvalidWidthError", error.ptr());
  py::register_exception<scalarnet::UnsetRegisterReadError>(
      m, "UnsetRegisterReadError", error.ptr());
  py::register_exception<scalarnet::OutputUnwrittenError>(
      m, "OutputUnwrittenError", error.ptr());
  py::register_exception<scalarnet::InputWidthMismatchError>(
      m, "InputWidthMismatchError", error.ptr());
}

// Single module definition
PYBIND11_MODULE(scalarnet, m) {
  m.doc() = "Scalar autograd neural network module";

  bind_errors(m);

  // Bind the Value class
  py::class_<scalarnet::Value>(m, "Value")
      .def(py::init<double>(), "data"_a)
      .def("__repr__", &scalarnet::Value::to_string,
           "String representation of the value")

      .def_property("data", &scalarnet::Value::data,
                    &scalarnet::Value::set_data)
      .def_property_readonly("grad", &scalarnet::Value::grad)
      .def("is_leaf", &scalarnet::Value::is_leaf)

      .def("backward", &scalarnet::Value::backward, "grad_output"_a = 1.0)
      .def("zero_grad", &scalarnet::Value::zero_grad)
      .def("print", &scalarnet::Value::print)

      .def("relu", &scalarnet::Value::relu)
      .def("tanh", &scalarnet::Value::tanh)
      .def("__pow__", &scalarnet::Value::pow)

      .def(py::self + py::self)
      .def(py::self - py::self)
      .def(py::self * py::self)
      .def(py::self / py::self)
      .def(-py::self)
      .def(py::self + double())
      .def(py::self - double())
      .def(py::self * double())
      .def(py::self / double())
      .def(double() + py::self)
      .def(double() - py::self)
      .def(double() * py::self)
      .def(double() / py::self);

  m.def("relu", py::overload_cast<const scalarnet::Value &>(&scalarnet::relu));
  m.def("tanh", py::overload_cast<const scalarnet::Value &>(&scalarnet::tanh));

  py::enum_<scalarnet::Activation>(m, "Activation")
      .value("Linear", scalarnet::Activation::Linear)
      .value("ReLU", scalarnet::Activation::ReLU)
      .value("Tanh", scalarnet::Activation::Tanh)
      .export_values();

  py::class_<scalarnet::UnitOptions>(m, "UnitOptions")
      .def(py::init([](scalarnet::Activation activation) {
             return scalarnet::UnitOptions{activation};
           }),
           "activation"_a = scalarnet::Activation::ReLU)
      .def_readwrite("activation", &scalarnet::UnitOptions::activation)
      .def("nonlin", &scalarnet::UnitOptions::nonlin);

  py::class_<scalarnet::RandomSource>(m, "RandomSource")
      .def(py::init<uint32_t>(), "seed"_a = 42u)
      .def("uniform", &scalarnet::RandomSource::uniform, "lo"_a, "hi"_a)
      .def("seed", &scalarnet::RandomSource::seed)
      .def("reseed", &scalarnet::RandomSource::reseed, "seed"_a);

  py::class_<scalarnet::Module>(m, "Module")
      .def("parameters", &scalarnet::Module::parameters)
      .def("zero_grad", &scalarnet::Module::zero_grad)
      .def("num_parameters", &scalarnet::Module::num_parameters)
      .def("print", &scalarnet::Module::print)
      .def("__repr__", &scalarnet::Module::to_string);

  py::class_<scalarnet::Neuron, scalarnet::Module>(m, "Neuron")
      .def(py::init<int64_t, scalarnet::RandomSource &,
                    scalarnet::UnitOptions>(),
           "nin"_a, "rng"_a, "options"_a = scalarnet::UnitOptions{})
      .def("__call__", &scalarnet::Neuron::forward, "x"_a)
      .def("forward", &scalarnet::Neuron::forward, "x"_a)
      .def("nin", &scalarnet::Neuron::nin)
      .def("nonlin", &scalarnet::Neuron::nonlin)
      .def_readonly("weights", &scalarnet::Neuron::weights)
      .def_readonly("bias", &scalarnet::Neuron::bias);

  py::class_<scalarnet::Layer, scalarnet::Module>(m, "Layer")
      .def(py::init<int64_t, int64_t, scalarnet::RandomSource &,
                    scalarnet::UnitOptions>(),
           "nin"_a, "nout"_a, "rng"_a, "options"_a = scalarnet::UnitOptions{})
      .def("__call__", &scalarnet::Layer::forward, "x"_a)
      .def("forward", &scalarnet::Layer::forward, "x"_a)
      .def("nin", &scalarnet::Layer::nin)
      .def("nout", &scalarnet::Layer::nout)
      .def_readonly("neurons", &scalarnet::Layer::neurons);

  py::class_<scalarnet::ConjoinLayer, scalarnet::Layer>(m, "ConjoinLayer")
      .def(py::init<const scalarnet::Layer &, const scalarnet::Layer &,
                    int64_t, scalarnet::RandomSource &,
                    scalarnet::UnitOptions>(),
           "l1"_a, "l2"_a, "nout"_a, "rng"_a,
           "options"_a = scalarnet::UnitOptions{});

  py::class_<scalarnet::RegisterConjoinLayer, scalarnet::Layer>(
      m, "RegisterConjoinLayer")
      .def(py::init<int64_t, int64_t, int64_t, scalarnet::RandomSource &,
                    scalarnet::UnitOptions>(),
           "nin1"_a, "nin2"_a, "nout"_a, "rng"_a,
           "options"_a = scalarnet::UnitOptions{});

  py::class_<scalarnet::MLP, scalarnet::Module>(m, "MLP")
      .def(py::init<int64_t, const std::vector<int64_t> &,
                    scalarnet::RandomSource &>(),
           "nin"_a, "nouts"_a, "rng"_a)
      .def("__call__", &scalarnet::MLP::forward, "x"_a)
      .def("forward", &scalarnet::MLP::forward, "x"_a)
      .def("layers", &scalarnet::MLP::layers,
           py::return_value_policy::reference_internal);

  py::class_<scalarnet::ArchitectureStep>(m, "ArchitectureStep")
      .def(py::init([](std::vector<std::string> inputs, int64_t width,
                       std::string output, scalarnet::UnitOptions options) {
             return scalarnet::ArchitectureStep{std::move(inputs), width,
                                                std::move(output), options};
           }),
           "inputs"_a, "width"_a, "output"_a,
           "options"_a = scalarnet::UnitOptions{})
      .def_readwrite("inputs", &scalarnet::ArchitectureStep::inputs)
      .def_readwrite("width", &scalarnet::ArchitectureStep::width)
      .def_readwrite("output", &scalarnet::ArchitectureStep::output)
      .def_readwrite("options", &scalarnet::ArchitectureStep::options);

  py::class_<scalarnet::ArchitecturalModel, scalarnet::Module>(
      m, "ArchitecturalModel")
      .def(py::init<int64_t, const std::vector<std::string> &,
                    const scalarnet::Architecture &,
                    scalarnet::RandomSource &>(),
           "nin"_a, "registers"_a, "architecture"_a, "rng"_a)
      .def("__call__", &scalarnet::ArchitecturalModel::forward, "x"_a)
      .def("forward", &scalarnet::ArchitecturalModel::forward, "x"_a)
      .def("nin", &scalarnet::ArchitecturalModel::nin)
      .def("registers", &scalarnet::ArchitecturalModel::registers)
      .def("register_width", &scalarnet::ArchitecturalModel::register_width,
           "name"_a)
      .def("step_layer",
           [](const scalarnet::ArchitecturalModel &self, size_t i)
               -> const scalarnet::Layer & {
             return *self.steps().at(i).layer;
           },
           "index"_a, py::return_value_policy::reference_internal)
      .def("num_steps", [](const scalarnet::ArchitecturalModel &self) {
        return self.steps().size();
      });
}
