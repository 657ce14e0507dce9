#include "ybus/sparse/sparse_builder.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

#include "ybus/logging/logger.h"

namespace ybus::sparse {

namespace {

void validate_triplets(std::vector<Triplet> const& triplets, int dimension) {
    for (size_t idx = 0; idx < triplets.size(); ++idx) {
        auto const& t = triplets[idx];
        if (t.row < 1 || t.row > dimension || t.col < 1 || t.col > dimension) {
            throw InvalidCoordinate(t.row, t.col, dimension, static_cast<int>(idx));
        }
    }
}

void check_mode(ResolveMode mode) {
    if (mode != ResolveMode::REPLACE && mode != ResolveMode::ADD) {
        throw InvalidMode(std::to_string(static_cast<int>(mode)));
    }
}

}  // namespace

LinkedSparseMatrix build(std::vector<Triplet> const& triplets, int dimension, ResolveMode mode) {
    check_mode(mode);

    auto start_time = std::chrono::high_resolution_clock::now();

    auto& logger = logging::global_logger;
    logger.setComponent("SparseBuilder");
    LOG_DEBUG(logger, "Building linked sparse matrix of dimension", dimension, "from",
              triplets.size(), "triplets, mode", resolve_mode_to_string(mode));

    validate_triplets(triplets, dimension);

    LinkedSparseMatrix matrix(dimension);
    matrix.reserve(triplets.size());

    size_t collisions = 0;
    for (auto const& triplet : triplets) {
        if (!matrix.insert_or_resolve(triplet, mode).inserted) {
            ++collisions;
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    LOG_DEBUG(logger, "  Stored", matrix.nnz(), "elements,", collisions, "collisions resolved");
    LOG_DEBUG(logger, "  Build time:",
              std::chrono::duration<double, std::milli>(end_time - start_time).count(), "ms");

    return matrix;
}

LinkedSparseMatrix build(std::vector<Triplet> const& triplets, ResolveMode mode) {
    check_mode(mode);
    int dimension = infer_dimension(triplets);
    if (dimension < 1) {
        throw InvalidCoordinate(0, 0, dimension);
    }
    return build(triplets, dimension, mode);
}

LinkedSparseMatrix build_from_dense(DenseMatrix const& dense, Float tolerance) {
    if (dense.num_rows != dense.num_cols) {
        throw std::invalid_argument("Dense matrix must be square, got " +
                                    std::to_string(dense.num_rows) + "x" +
                                    std::to_string(dense.num_cols));
    }
    return build(dense_to_triplets(dense, tolerance), dense.num_rows, ResolveMode::REPLACE);
}

DenseMatrix to_dense(std::vector<Triplet> const& triplets, int dimension) {
    if (dimension < 1) {
        throw InvalidCoordinate(dimension, dimension, dimension);
    }
    validate_triplets(triplets, dimension);

    DenseMatrix dense(dimension, dimension);
    for (auto const& t : triplets) {
        dense(t.row, t.col) = t.value;
    }
    return dense;
}

std::vector<Triplet> dense_to_triplets(DenseMatrix const& dense, Float tolerance) {
    std::vector<Triplet> triplets;
    for (int row = 1; row <= dense.num_rows; ++row) {
        for (int col = 1; col <= dense.num_cols; ++col) {
            Complex const value = dense(row, col);
            if (std::abs(value) > tolerance) {
                triplets.push_back({row, col, value});
            }
        }
    }
    return triplets;
}

int infer_dimension(std::vector<Triplet> const& triplets) noexcept {
    int dimension = 0;
    for (auto const& t : triplets) {
        dimension = std::max({dimension, t.row, t.col});
    }
    return dimension;
}

}  // namespace ybus::sparse
