/**
 * @file ybus_bindings.cpp
 * @brief Main pybind11 bindings for the YBUS linked sparse matrix builder
 */

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ybus/core/errors.h"
#include "ybus/logging/log_config.h"

// Forward declarations for modular bindings
void init_core_types(pybind11::module& m);
void init_sparse_bindings(pybind11::module& m);
void init_admittance_bindings(pybind11::module& m);
void init_io_bindings(pybind11::module& m);

namespace py = pybind11;
using namespace ybus;

PYBIND11_MODULE(ybus_sparse, m) {
    m.doc() = "YBUS Linked Sparse Matrix Builder - Python Bindings";

    m.attr("__version__") = py::str(VERSION_INFO);

    py::register_exception<InvalidCoordinate>(m, "InvalidCoordinate", PyExc_IndexError);
    py::register_exception<InvalidMode>(m, "InvalidMode", PyExc_ValueError);

    init_core_types(m);
    init_sparse_bindings(m);
    init_admittance_bindings(m);
    init_io_bindings(m);

    m.def("log_for_development", &logging::LogConfig::forDevelopment,
          "Log DEBUG and above to the console");
    m.def("log_for_benchmarking", &logging::LogConfig::forBenchmarking, "Disable logging");
    m.def("log_from_environment", &logging::LogConfig::fromEnvironment,
          "Configure logging from YBUS_LOG_LEVEL, YBUS_LOG_OUTPUT and YBUS_LOG_FILE");
}
