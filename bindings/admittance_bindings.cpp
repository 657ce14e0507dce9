/**
 * @file admittance_bindings.cpp
 * @brief Y-bus builder bindings for YBUS
 */

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ybus/admittance/admittance_interface.h"
#include "ybus/core/builder_factory.h"

namespace py = pybind11;
using namespace ybus;
using namespace ybus::admittance;

void init_admittance_bindings(pybind11::module& m) {
    py::class_<YbusOptions>(m, "YbusOptions")
        .def(py::init<>())
        .def_readwrite("disable_taps", &YbusOptions::disable_taps)
        .def_readwrite("ordering", &YbusOptions::ordering)
        .def_readwrite("zero_tolerance", &YbusOptions::zero_tolerance);

    py::class_<YbusResult>(m, "YbusResult")
        .def_readonly("sparse", &YbusResult::sparse)
        .def_readonly("ybus", &YbusResult::ybus)
        .def_readonly("b_matrix", &YbusResult::b_matrix)
        .def_readonly("branch_susceptance", &YbusResult::branch_susceptance)
        .def_readonly("incidence", &YbusResult::incidence)
        .def_readonly("branch_names", &YbusResult::branch_names)
        .def_readonly("adjacency", &YbusResult::adjacency)
        .def_readonly("row_labels", &YbusResult::row_labels)
        .def_readonly("bus_order", &YbusResult::bus_order);

    py::class_<IAdmittanceBuilder>(m, "IAdmittanceBuilder")
        .def("build_triplets", &IAdmittanceBuilder::build_triplets, py::arg("network"),
             py::arg("options") = YbusOptions{})
        .def("build_ybus", &IAdmittanceBuilder::build_ybus, py::arg("network"),
             py::arg("options") = YbusOptions{})
        .def("update_ybus", &IAdmittanceBuilder::update_ybus, py::arg("matrix"),
             py::arg("network"), py::arg("branch_changes"), py::arg("options") = YbusOptions{});

    m.def(
        "create_admittance_builder",
        []() { return core::BuilderFactory::create_admittance_builder(); },
        "Create the Y-bus builder");

    m.def(
        "build_ybus",
        [](NetworkData const& network, YbusOptions const& options) {
            auto builder = core::BuilderFactory::create_admittance_builder();
            return builder->build_ybus(network, options);
        },
        "Build the Y-bus and companion matrices", py::arg("network"),
        py::arg("options") = YbusOptions{});
}
