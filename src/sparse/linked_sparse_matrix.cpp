#include "ybus/sparse/linked_sparse_matrix.h"

#include <stdexcept>

#include "ybus/logging/logger.h"

namespace ybus::sparse {

LinkedSparseMatrix::LinkedSparseMatrix(int dimension) : dimension_(dimension) {
    if (dimension < 1) {
        throw InvalidCoordinate(dimension, dimension, dimension);
    }
    first_in_row_.assign(static_cast<std::size_t>(dimension), kNoElement);
    first_in_col_.assign(static_cast<std::size_t>(dimension), kNoElement);
}

InsertResult LinkedSparseMatrix::insert_or_resolve(int row, int col, Complex value,
                                                   ResolveMode mode) {
    if (mode != ResolveMode::REPLACE && mode != ResolveMode::ADD) {
        throw InvalidMode(std::to_string(static_cast<int>(mode)));
    }
    check_coordinate(row, col);

    auto& logger = logging::global_logger;

    // Both walks are read-only; nothing is touched until the outcome is known.
    ChainSlot const row_slot = locate(Axis::ROW, row, col);
    ChainSlot const col_slot = locate(Axis::COL, col, row);

    int incumbent = row_slot.incumbent != kNoElement ? row_slot.incumbent : col_slot.incumbent;
    if (incumbent != kNoElement) {
        Element& target = element_mut(incumbent);
        if (mode == ResolveMode::REPLACE) {
            target.value = value;
        } else {
            target.value += value;
        }
        LOG_TRACE(logger, "Collision at (", row, ",", col, ") with element", incumbent,
                  "resolved by", resolve_mode_to_string(mode));
        return {incumbent, false};
    }

    int const new_id = nnz() + 1;
    elements_.push_back(Element{.id = new_id,
                                .value = value,
                                .row = row,
                                .col = col,
                                .next_in_row = row_slot.next,
                                .next_in_col = col_slot.next});
    splice(Axis::ROW, row, row_slot, new_id);
    splice(Axis::COL, col, col_slot, new_id);

    return {new_id, true};
}

LinkedSparseMatrix::ChainSlot LinkedSparseMatrix::locate(Axis axis, int line, int key) const {
    auto& logger = logging::global_logger;

    ChainSlot slot;
    int current = head(axis, line);
    while (current != kNoElement) {
        Element const& incumbent = element(current);
        int const incumbent_key = key_of(incumbent, axis);
        if (key < incumbent_key) {
            slot.next = current;
            LOG_TRACE(logger, axis_name(axis), line, ": candidate", key, "goes before element",
                      current);
            return slot;
        }
        if (key == incumbent_key) {
            slot.next = current;
            slot.incumbent = current;
            return slot;
        }
        slot.prev = current;
        current = next_link(incumbent, axis);
    }

    LOG_TRACE(logger, axis_name(axis), line, ": candidate", key,
              slot.prev == kNoElement ? "starts an empty chain" : "is appended at the tail");
    return slot;
}

void LinkedSparseMatrix::splice(Axis axis, int line, ChainSlot const& slot, int new_id) {
    if (slot.prev == kNoElement) {
        head(axis, line) = new_id;
    } else {
        next_link(element_mut(slot.prev), axis) = new_id;
    }
}

int LinkedSparseMatrix::first_in_row(int row) const {
    check_coordinate(row, 1);
    return head(Axis::ROW, row);
}

int LinkedSparseMatrix::first_in_col(int col) const {
    check_coordinate(1, col);
    return head(Axis::COL, col);
}

Element const& LinkedSparseMatrix::element(int id) const {
    if (id < 1 || id > nnz()) {
        throw std::out_of_range("Element id " + std::to_string(id) + " outside [1, " +
                                std::to_string(nnz()) + "]");
    }
    return elements_[static_cast<std::size_t>(id - 1)];
}

std::optional<int> LinkedSparseMatrix::find(int row, int col) const {
    check_coordinate(row, col);
    ChainSlot const slot = locate(Axis::ROW, row, col);
    if (slot.incumbent == kNoElement) {
        return std::nullopt;
    }
    return slot.incumbent;
}

Complex LinkedSparseMatrix::value_at(int row, int col) const {
    auto id = find(row, col);
    return id ? element(*id).value : Complex(0.0, 0.0);
}

std::vector<int> LinkedSparseMatrix::row_chain(int row) const {
    check_coordinate(row, 1);
    return chain(Axis::ROW, row);
}

std::vector<int> LinkedSparseMatrix::col_chain(int col) const {
    check_coordinate(1, col);
    return chain(Axis::COL, col);
}

std::vector<int> LinkedSparseMatrix::chain(Axis axis, int line) const {
    std::vector<int> ids;
    for (int id = head(axis, line); id != kNoElement; id = next_link(element(id), axis)) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<Triplet> LinkedSparseMatrix::to_triplets() const {
    std::vector<Triplet> triplets;
    triplets.reserve(elements_.size());
    for (int row = 1; row <= dimension_; ++row) {
        for (int id = head(Axis::ROW, row); id != kNoElement; id = element(id).next_in_row) {
            Element const& e = element(id);
            triplets.push_back({e.row, e.col, e.value});
        }
    }
    return triplets;
}

DenseMatrix LinkedSparseMatrix::to_dense() const {
    DenseMatrix dense(dimension_, dimension_);
    for (auto const& e : elements_) {
        dense(e.row, e.col) = e.value;
    }
    return dense;
}

SparseMatrix LinkedSparseMatrix::to_csr() const {
    SparseMatrix csr;
    csr.num_rows = dimension_;
    csr.num_cols = dimension_;
    csr.row_ptr.reserve(static_cast<std::size_t>(dimension_) + 1);
    csr.col_idx.reserve(elements_.size());
    csr.values.reserve(elements_.size());

    csr.row_ptr.push_back(0);
    for (int row = 1; row <= dimension_; ++row) {
        for (int id = head(Axis::ROW, row); id != kNoElement; id = element(id).next_in_row) {
            Element const& e = element(id);
            csr.col_idx.push_back(e.col - 1);
            csr.values.push_back(e.value);
        }
        csr.row_ptr.push_back(static_cast<int>(csr.col_idx.size()));
    }
    csr.nnz = static_cast<int>(csr.values.size());
    return csr;
}

bool LinkedSparseMatrix::check_invariants(std::string* reason) const {
    for (std::size_t k = 0; k < elements_.size(); ++k) {
        if (elements_[k].id != static_cast<int>(k) + 1) {
            if (reason) *reason = "element at position " + std::to_string(k + 1) + " has id " +
                                  std::to_string(elements_[k].id);
            return false;
        }
    }

    std::vector<int> row_visits(elements_.size(), 0);
    std::vector<int> col_visits(elements_.size(), 0);
    if (!check_axis(Axis::ROW, row_visits, reason)) return false;
    if (!check_axis(Axis::COL, col_visits, reason)) return false;

    for (std::size_t k = 0; k < elements_.size(); ++k) {
        if (row_visits[k] != 1 || col_visits[k] != 1) {
            if (reason) *reason = "element " + std::to_string(k + 1) + " reached " +
                                  std::to_string(row_visits[k]) + " times by rows and " +
                                  std::to_string(col_visits[k]) + " times by columns";
            return false;
        }
    }
    return true;
}

bool LinkedSparseMatrix::check_axis(Axis axis, std::vector<int>& visits,
                                    std::string* reason) const {
    std::size_t steps = 0;
    for (int line = 1; line <= dimension_; ++line) {
        int previous_key = 0;
        for (int id = head(axis, line); id != kNoElement;) {
            if (id < 1 || id > nnz() || ++steps > elements_.size()) {
                if (reason) *reason = std::string(axis_name(axis)) + " " +
                                      std::to_string(line) + " has a dangling or cyclic link";
                return false;
            }
            Element const& e = element(id);
            if (line_of(e, axis) != line) {
                if (reason) *reason = "element " + std::to_string(id) + " is chained into " +
                                      axis_name(axis) + " " + std::to_string(line);
                return false;
            }
            if (key_of(e, axis) <= previous_key) {
                if (reason) *reason = std::string(axis_name(axis)) + " " +
                                      std::to_string(line) + " is not strictly increasing";
                return false;
            }
            previous_key = key_of(e, axis);
            ++visits[static_cast<std::size_t>(id - 1)];
            id = next_link(e, axis);
        }
    }
    return true;
}

int LinkedSparseMatrix::head(Axis axis, int line) const {
    auto const& heads = axis == Axis::ROW ? first_in_row_ : first_in_col_;
    return heads[static_cast<std::size_t>(line - 1)];
}

int& LinkedSparseMatrix::head(Axis axis, int line) {
    auto& heads = axis == Axis::ROW ? first_in_row_ : first_in_col_;
    return heads[static_cast<std::size_t>(line - 1)];
}

int LinkedSparseMatrix::next_link(Element const& element, Axis axis) noexcept {
    return axis == Axis::ROW ? element.next_in_row : element.next_in_col;
}

int& LinkedSparseMatrix::next_link(Element& element, Axis axis) noexcept {
    return axis == Axis::ROW ? element.next_in_row : element.next_in_col;
}

int LinkedSparseMatrix::line_of(Element const& element, Axis axis) noexcept {
    return axis == Axis::ROW ? element.row : element.col;
}

int LinkedSparseMatrix::key_of(Element const& element, Axis axis) noexcept {
    return axis == Axis::ROW ? element.col : element.row;
}

char const* LinkedSparseMatrix::axis_name(Axis axis) noexcept {
    return axis == Axis::ROW ? "row" : "column";
}

void LinkedSparseMatrix::check_coordinate(int row, int col) const {
    if (row < 1 || row > dimension_ || col < 1 || col > dimension_) {
        throw InvalidCoordinate(row, col, dimension_);
    }
}

}  // namespace ybus::sparse
