#pragma once

#include <vector>

#include "ybus/core/types.h"
#include "ybus/sparse/linked_sparse_matrix.h"

namespace ybus::sparse {

/**
 * @brief Build a linked sparse matrix from an ordered triple sequence
 *
 * Triples are applied in sequence order with a single resolution mode. All coordinates are
 * validated before the first insertion; the first invalid triple aborts the build.
 *
 * @param triplets Input triples (1-based coordinates)
 * @param dimension Matrix dimension N
 * @param mode Collision resolution for repeated (row, col) pairs
 * @return Completed matrix
 * @throws InvalidMode if mode is not a known ResolveMode, checked before any coordinate
 * @throws InvalidCoordinate naming the index of the first out-of-range triple
 */
LinkedSparseMatrix build(std::vector<Triplet> const& triplets, int dimension, ResolveMode mode);

/**
 * @brief Build with the dimension inferred as the largest row/col coordinate
 * @throws InvalidCoordinate for an empty sequence or non-positive coordinates
 */
LinkedSparseMatrix build(std::vector<Triplet> const& triplets, ResolveMode mode);

/**
 * @brief Build from the non-zeros of a square dense matrix using REPLACE
 */
LinkedSparseMatrix build_from_dense(DenseMatrix const& dense, Float tolerance = 0.0);

/**
 * @brief Reference densification, last write wins on repeated coordinates
 */
DenseMatrix to_dense(std::vector<Triplet> const& triplets, int dimension);

/**
 * @brief Row-major extraction of entries with magnitude above tolerance
 */
std::vector<Triplet> dense_to_triplets(DenseMatrix const& dense, Float tolerance = 0.0);

/**
 * @brief Largest row or column coordinate in the sequence, 0 when empty
 */
int infer_dimension(std::vector<Triplet> const& triplets) noexcept;

}  // namespace ybus::sparse
