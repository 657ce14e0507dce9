/**
 * @file core_bindings.cpp
 * @brief Core type bindings for YBUS
 */

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ybus/core/types.h"

namespace py = pybind11;
using namespace ybus;

void init_core_types(pybind11::module& m) {
    // Enumerations
    py::enum_<ResolveMode>(m, "ResolveMode")
        .value("REPLACE", ResolveMode::REPLACE, "Overwrite the incumbent value")
        .value("ADD", ResolveMode::ADD, "Accumulate into the incumbent value")
        .export_values();

    py::enum_<BusType>(m, "BusType")
        .value("PQ", BusType::PQ, "Load bus (P and Q specified)")
        .value("PV", BusType::PV, "Generator bus (P and V specified)")
        .value("SLACK", BusType::SLACK, "Slack/reference bus (V and angle specified)")
        .export_values();

    py::enum_<BusOrdering>(m, "BusOrdering")
        .value("BUS_NUMBERS", BusOrdering::BUS_NUMBERS, "Table order")
        .value("BUS_TYPES", BusOrdering::BUS_TYPES, "Slack, then PV, then PQ")
        .export_values();

    m.def("resolve_mode_from_string", &resolve_mode_from_string,
          "Parse \"replace\" or \"add\"", py::arg("name"));

    // Data structures
    py::class_<Triplet>(m, "Triplet")
        .def(py::init<>())
        .def(py::init([](int row, int col, Complex value) { return Triplet{row, col, value}; }),
             py::arg("row"), py::arg("col"), py::arg("value"))
        .def_readwrite("row", &Triplet::row, "Row (1-based)")
        .def_readwrite("col", &Triplet::col, "Column (1-based)")
        .def_readwrite("value", &Triplet::value, "Complex value")
        .def("__repr__", [](Triplet const& t) {
            return "<Triplet (" + std::to_string(t.row) + ", " + std::to_string(t.col) + ")>";
        });

    py::class_<DenseMatrix>(m, "DenseMatrix")
        .def(py::init<int, int>(), py::arg("rows"), py::arg("cols"))
        .def_readonly("num_rows", &DenseMatrix::num_rows)
        .def_readonly("num_cols", &DenseMatrix::num_cols)
        .def("__getitem__",
             [](DenseMatrix const& d, std::pair<int, int> rc) {
                 if (rc.first < 1 || rc.first > d.num_rows || rc.second < 1 ||
                     rc.second > d.num_cols) {
                     throw py::index_error("1-based index out of range");
                 }
                 return d(rc.first, rc.second);
             })
        .def("to_list", [](DenseMatrix const& d) {
            std::vector<std::vector<Complex>> rows(static_cast<size_t>(d.num_rows));
            for (int r = 1; r <= d.num_rows; ++r) {
                for (int c = 1; c <= d.num_cols; ++c) {
                    rows[static_cast<size_t>(r - 1)].push_back(d(r, c));
                }
            }
            return rows;
        });

    py::class_<RealMatrix>(m, "RealMatrix")
        .def_readonly("num_rows", &RealMatrix::num_rows)
        .def_readonly("num_cols", &RealMatrix::num_cols)
        .def("to_list", [](RealMatrix const& d) {
            std::vector<std::vector<Float>> rows(static_cast<size_t>(d.num_rows));
            for (int r = 1; r <= d.num_rows; ++r) {
                for (int c = 1; c <= d.num_cols; ++c) {
                    rows[static_cast<size_t>(r - 1)].push_back(d(r, c));
                }
            }
            return rows;
        });

    py::class_<SparseMatrix>(m, "SparseMatrix")
        .def_readonly("row_ptr", &SparseMatrix::row_ptr, "Row pointers (CSR format)")
        .def_readonly("col_idx", &SparseMatrix::col_idx, "Column indices")
        .def_readonly("values", &SparseMatrix::values, "Complex values")
        .def_readonly("num_rows", &SparseMatrix::num_rows)
        .def_readonly("num_cols", &SparseMatrix::num_cols)
        .def_readonly("nnz", &SparseMatrix::nnz);

    py::class_<BusData>(m, "BusData")
        .def(py::init<>())
        .def_readwrite("id", &BusData::id, "Bus number")
        .def_readwrite("bus_type", &BusData::bus_type, "Bus type")
        .def_readwrite("g_pu", &BusData::g_pu, "Shunt conductance (p.u.)")
        .def_readwrite("b_pu", &BusData::b_pu, "Shunt susceptance (p.u.)")
        .def("__repr__", [](BusData const& b) {
            return "<BusData id=" + std::to_string(b.id) + " " + bus_type_to_string(b.bus_type) +
                   ">";
        });

    py::class_<BranchData>(m, "BranchData")
        .def(py::init<>())
        .def_readwrite("id", &BranchData::id, "Branch ID")
        .def_readwrite("tap_bus", &BranchData::tap_bus, "Tap-side bus number")
        .def_readwrite("z_bus", &BranchData::z_bus, "Impedance-side bus number")
        .def_readwrite("r_pu", &BranchData::r_pu, "Series resistance (p.u.)")
        .def_readwrite("x_pu", &BranchData::x_pu, "Series reactance (p.u.)")
        .def_readwrite("b_pu", &BranchData::b_pu, "Line charging susceptance (p.u.)")
        .def_readwrite("tap", &BranchData::tap, "Transformer turns ratio, 0 for lines")
        .def_readwrite("shift", &BranchData::shift, "Phase shift (degrees)")
        .def_readwrite("in_service", &BranchData::in_service, "Branch in service")
        .def("__repr__", [](BranchData const& b) {
            return "<BranchData id=" + std::to_string(b.id) + " " + std::to_string(b.tap_bus) +
                   "->" + std::to_string(b.z_bus) + ">";
        });

    py::class_<NetworkData>(m, "NetworkData")
        .def(py::init<>())
        .def_readwrite("buses", &NetworkData::buses, "List of bus data")
        .def_readwrite("branches", &NetworkData::branches, "List of branch data")
        .def_readwrite("system_name", &NetworkData::system_name, "System name")
        .def("__repr__", [](NetworkData const& n) {
            return "<NetworkData " + n.system_name + " buses=" + std::to_string(n.num_buses()) +
                   " branches=" + std::to_string(n.num_branches()) + ">";
        });
}
