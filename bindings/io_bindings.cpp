/**
 * @file io_bindings.cpp
 * @brief I/O module bindings for YBUS
 */

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ybus/core/builder_factory.h"
#include "ybus/io/io_interface.h"

namespace py = pybind11;
using namespace ybus;
using namespace ybus::io;

void init_io_bindings(pybind11::module& m) {
    py::class_<IIOModule>(m, "IIOModule")
        .def("read_triplets", &IIOModule::read_triplets, "Read triples from a text file",
             py::arg("filename"))
        .def("write_triplets", &IIOModule::write_triplets, "Write triples to a text file",
             py::arg("filename"), py::arg("triplets"))
        .def("write_dense_csv", &IIOModule::write_dense_csv, "Write a dense matrix as CSV",
             py::arg("filename"), py::arg("matrix"),
             py::arg("labels") = std::vector<std::string>{})
        .def("write_real_csv", &IIOModule::write_real_csv, "Write a real matrix as CSV",
             py::arg("filename"), py::arg("matrix"),
             py::arg("labels") = std::vector<std::string>{})
        .def("validate_input_format", &IIOModule::validate_input_format, py::arg("filename"));

    m.def(
        "create_io_module", []() { return core::BuilderFactory::create_io_module(); },
        "Create I/O module instance");

    m.def(
        "load_triplets",
        [](std::string const& filename) {
            auto io_module = core::BuilderFactory::create_io_module();
            return io_module->read_triplets(filename);
        },
        "Load triples from a text file", py::arg("filename"));
}
