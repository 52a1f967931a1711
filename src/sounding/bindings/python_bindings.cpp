/**
 * @file python_bindings.cpp
 * @brief pybind11 Python bindings for the VESMod forward model
 *
 * Exposes the layered-earth forward simulation to Python so notebooks
 * and plotting/export tools can drive it with NumPy arrays.
 */

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "errors.hpp"
#include "layer_stack.hpp"
#include "survey.hpp"
#include "property_mapping.hpp"
#include "resistivity_kernel.hpp"
#include "hankel_filter.hpp"
#include "forward_simulation.hpp"
#include "noise_model.hpp"
#include "data_set.hpp"

namespace py = pybind11;
using namespace vesmod;

PYBIND11_MODULE(vesmod_forward, m) {
    m.doc() = "VESMod 1D DC resistivity forward model Python bindings";

    // ============================
    // Exceptions
    // ============================
    py::register_exception<InvalidModelError>(m, "InvalidModelError", PyExc_ValueError);
    py::register_exception<DegenerateElectrodeError>(m, "DegenerateElectrodeError", PyExc_ValueError);
    py::register_exception<DegenerateGeometryError>(m, "DegenerateGeometryError", PyExc_RuntimeError);
    py::register_exception<NumericalInstabilityError>(m, "NumericalInstabilityError", PyExc_RuntimeError);

    // ============================
    // LayerStack
    // ============================
    py::class_<LayerStack>(m, "LayerStack")
        .def(py::init<const std::vector<double>&, const std::vector<double>&>(),
             py::arg("resistivities"), py::arg("thicknesses"),
             "Create layered model (N resistivities, N-1 thicknesses)")

        .def_static("from_model", &LayerStack::from_model,
                    py::arg("m"), py::arg("mapping"), py::arg("thicknesses"),
                    "Create layered model from a model vector and mapping")

        .def_static("half_space", &LayerStack::half_space,
                    py::arg("resistivity"),
                    "Create homogeneous half-space")

        .def("n_layers", &LayerStack::n_layers)
        .def("resistivity", &LayerStack::resistivity, py::arg("i"))
        .def("thickness", &LayerStack::thickness, py::arg("i"))
        .def("depth_to_top", &LayerStack::depth_to_top, py::arg("i"))
        .def("is_last_layer", &LayerStack::is_last_layer, py::arg("i"))
        .def_property_readonly("resistivities", &LayerStack::resistivities)
        .def_property_readonly("thicknesses", &LayerStack::thicknesses);

    // ============================
    // Property mapping
    // ============================
    py::class_<PropertyMapping>(m, "PropertyMapping")
        .def_static("identity", &PropertyMapping::identity,
                    "Parameters are resistivities")
        .def_static("log_resistivity", &PropertyMapping::log_resistivity,
                    "Parameters are natural logs of resistivity")
        .def("apply", &PropertyMapping::apply, py::arg("m"))
        .def("deriv", &PropertyMapping::deriv, py::arg("m"))
        .def("name", &PropertyMapping::name);

    // ============================
    // Survey
    // ============================
    py::class_<Electrode>(m, "Electrode")
        .def(py::init<double, double>(), py::arg("x"), py::arg("y") = 0.0)
        .def_static("infinity", &Electrode::infinity, "Remote electrode of a pole")
        .def_readwrite("position", &Electrode::position)
        .def_readwrite("at_infinity", &Electrode::at_infinity);

    py::class_<SourceDipole>(m, "SourceDipole")
        .def(py::init<const Electrode&, const Electrode&, double>(),
             py::arg("a"), py::arg("b"), py::arg("current") = 1.0)
        .def_readwrite("a", &SourceDipole::a)
        .def_readwrite("b", &SourceDipole::b)
        .def_readwrite("current", &SourceDipole::current);

    py::class_<ReceiverDipole>(m, "ReceiverDipole")
        .def(py::init<const Electrode&, const Electrode&>(),
             py::arg("m"), py::arg("n"))
        .def_readwrite("m", &ReceiverDipole::m)
        .def_readwrite("n", &ReceiverDipole::n);

    py::class_<SurveyConfiguration>(m, "SurveyConfiguration")
        .def(py::init<const SourceDipole&, const std::vector<ReceiverDipole>&>(),
             py::arg("source"), py::arg("receivers"))
        .def("source", &SurveyConfiguration::source)
        .def("receivers", &SurveyConfiguration::receivers);

    py::class_<Survey>(m, "Survey")
        .def(py::init<const std::vector<SurveyConfiguration>&>(),
             py::arg("configurations"))
        .def("n_configurations", &Survey::n_configurations)
        .def("n_data", &Survey::n_data)
        .def("reciprocal", &Survey::reciprocal)
        .def_static("schlumberger", &Survey::schlumberger,
                    py::arg("ab2"), py::arg("mn2"), py::arg("x0") = 0.0)
        .def_static("wenner", &Survey::wenner,
                    py::arg("spacings"), py::arg("x0") = 0.0)
        .def_static("dipole_dipole", &Survey::dipole_dipole,
                    py::arg("a"), py::arg("n_spacings"), py::arg("x0") = 0.0)
        .def_static("pole_dipole", &Survey::pole_dipole,
                    py::arg("a"), py::arg("n_spacings"), py::arg("x0") = 0.0)
        .def_static("pole_pole", &Survey::pole_pole,
                    py::arg("spacings"), py::arg("x0") = 0.0);

    // ============================
    // Data
    // ============================
    py::enum_<DataType>(m, "DataType")
        .value("ApparentResistivity", DataType::ApparentResistivity)
        .value("Voltage", DataType::Voltage);

    py::class_<DataSet>(m, "DataSet")
        .def("__len__", &DataSet::size)
        .def("values", &DataSet::values)
        .def("has_uncertainty", &DataSet::has_uncertainty)
        .def("uncertainties", &DataSet::uncertainties)
        .def("to_table", &DataSet::to_table,
             "Rows in survey order: AB/2, MN/2, value[, uncertainty]")
        .def("column_names", &DataSet::column_names);

    // ============================
    // Simulation
    // ============================
    py::class_<SimulationConfig>(m, "SimulationConfig")
        .def(py::init<>())
        .def_readwrite("data_type", &SimulationConfig::data_type)
        .def_readwrite("num_threads", &SimulationConfig::num_threads)
        .def_readwrite("min_offset", &SimulationConfig::min_offset);

    py::class_<NoiseConfig>(m, "NoiseConfig")
        .def(py::init<>())
        .def_readwrite("enabled", &NoiseConfig::enabled)
        .def_readwrite("relative_std", &NoiseConfig::relative_std)
        .def_readwrite("noise_floor", &NoiseConfig::noise_floor)
        .def_readwrite("seed", &NoiseConfig::seed);

    py::class_<ForwardSimulation>(m, "ForwardSimulation")
        .def(py::init([](const Survey& survey, const SimulationConfig& config) {
                 return ForwardSimulation(survey, config);
             }),
             py::arg("survey"), py::arg("config") = SimulationConfig(),
             "Create forward simulation with the default Hankel filter")

        .def("simulate",
             py::overload_cast<const LayerStack&>(&ForwardSimulation::simulate, py::const_),
             py::arg("model"),
             "Predict data for a layered model")

        .def("simulate",
             py::overload_cast<const Eigen::VectorXd&, const PropertyMapping&,
                               const std::vector<double>&>(&ForwardSimulation::simulate, py::const_),
             py::arg("m"), py::arg("mapping"), py::arg("thicknesses"),
             "Predict data for a model vector through a mapping")

        .def("geometric_factors", &ForwardSimulation::geometric_factors);

    py::class_<NoiseModel>(m, "NoiseModel")
        .def(py::init<const NoiseConfig&>(), py::arg("config"))
        .def("apply", &NoiseModel::apply, py::arg("data"));

    m.def("make_synthetic_data", &make_synthetic_data,
          py::arg("simulation"), py::arg("model"), py::arg("noise"),
          "Forward simulation followed by noise injection");

    m.def("resistivity_transform", &resistivity_transform,
          py::arg("model"), py::arg("wavenumber"),
          "Resistivity transform T(lambda) of a layered model");

    // Version info
    m.attr("__version__") = "0.1.0";
}
