/**
 * @file sparse_bindings.cpp
 * @brief Linked sparse matrix bindings for YBUS
 */

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ybus/sparse/linked_sparse_matrix.h"
#include "ybus/sparse/sparse_builder.h"

namespace py = pybind11;
using namespace ybus;
using namespace ybus::sparse;

void init_sparse_bindings(pybind11::module& m) {
    m.attr("NO_ELEMENT") = py::int_(kNoElement);

    py::class_<Element>(m, "Element")
        .def_readonly("id", &Element::id)
        .def_readonly("value", &Element::value)
        .def_readonly("row", &Element::row)
        .def_readonly("col", &Element::col)
        .def_readonly("next_in_row", &Element::next_in_row)
        .def_readonly("next_in_col", &Element::next_in_col)
        .def("__repr__", [](Element const& e) {
            return "<Element id=" + std::to_string(e.id) + " (" + std::to_string(e.row) + ", " +
                   std::to_string(e.col) + ") NIR=" + std::to_string(e.next_in_row) +
                   " NIC=" + std::to_string(e.next_in_col) + ">";
        });

    py::class_<InsertResult>(m, "InsertResult")
        .def_readonly("element_id", &InsertResult::element_id)
        .def_readonly("inserted", &InsertResult::inserted);

    py::class_<LinkedSparseMatrix>(m, "LinkedSparseMatrix")
        .def(py::init<int>(), py::arg("dimension"))
        .def("insert_or_resolve",
             py::overload_cast<int, int, Complex, ResolveMode>(
                 &LinkedSparseMatrix::insert_or_resolve),
             "Insert a value or resolve a collision at (row, col)", py::arg("row"),
             py::arg("col"), py::arg("value"), py::arg("mode") = ResolveMode::REPLACE)
        .def_property_readonly("dimension", &LinkedSparseMatrix::dimension)
        .def_property_readonly("nnz", &LinkedSparseMatrix::nnz)
        .def("first_in_row", &LinkedSparseMatrix::first_in_row, py::arg("row"))
        .def("first_in_col", &LinkedSparseMatrix::first_in_col, py::arg("col"))
        // Copies: the element store reallocates as the matrix grows
        .def(
            "element", [](LinkedSparseMatrix const& matrix, int id) { return matrix.element(id); },
            py::arg("id"))
        .def("elements",
             [](LinkedSparseMatrix const& matrix) {
                 return std::vector<Element>(matrix.elements().begin(), matrix.elements().end());
             })
        .def("find", &LinkedSparseMatrix::find, py::arg("row"), py::arg("col"))
        .def("value_at", &LinkedSparseMatrix::value_at, py::arg("row"), py::arg("col"))
        .def("row_chain", &LinkedSparseMatrix::row_chain, py::arg("row"))
        .def("col_chain", &LinkedSparseMatrix::col_chain, py::arg("col"))
        .def("to_triplets", &LinkedSparseMatrix::to_triplets)
        .def("to_dense", &LinkedSparseMatrix::to_dense)
        .def("to_csr", &LinkedSparseMatrix::to_csr)
        .def("check_invariants", [](LinkedSparseMatrix const& matrix) {
            std::string reason;
            bool ok = matrix.check_invariants(&reason);
            return py::make_tuple(ok, reason);
        });

    m.def("build",
          py::overload_cast<std::vector<Triplet> const&, int, ResolveMode>(&ybus::sparse::build),
          "Build a linked sparse matrix from triples", py::arg("triplets"), py::arg("dimension"),
          py::arg("mode") = ResolveMode::REPLACE);
    m.def("build_inferred",
          py::overload_cast<std::vector<Triplet> const&, ResolveMode>(&ybus::sparse::build),
          "Build with the dimension inferred from the triples", py::arg("triplets"),
          py::arg("mode") = ResolveMode::REPLACE);
    m.def("build_from_dense", &build_from_dense, py::arg("dense"), py::arg("tolerance") = 0.0);
    m.def("to_dense", &ybus::sparse::to_dense, "Reference densification, last write wins",
          py::arg("triplets"), py::arg("dimension"));
    m.def("dense_to_triplets", &dense_to_triplets, py::arg("dense"),
          py::arg("tolerance") = 0.0);
}
