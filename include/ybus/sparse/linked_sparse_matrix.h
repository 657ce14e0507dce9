#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ybus/core/errors.h"
#include "ybus/core/types.h"

namespace ybus::sparse {

/**
 * @brief One stored non-zero entry
 *
 * Links hold element ids (1-based positions in the element store) or kNoElement.
 */
struct Element {
    int id;
    Complex value;
    int row;
    int col;
    int next_in_row{kNoElement};
    int next_in_col{kNoElement};
};

/**
 * @brief Outcome of a single insert_or_resolve call
 */
struct InsertResult {
    int element_id;  // New element, or the incumbent that absorbed the value
    bool inserted;   // false when an existing (row, col) element was resolved
};

/**
 * @brief N x N sparse matrix stored as row and column linked chains over a flat arena
 *
 * Every row r has a chain starting at first_in_row(r) and following next_in_row, ordered
 * by strictly increasing column. Columns are chained the same way by increasing row.
 * Elements are only ever appended, so ids stay valid for the lifetime of the matrix.
 *
 * Not safe for concurrent mutation.
 */
class LinkedSparseMatrix {
  public:
    /**
     * @brief Create an empty matrix with all row/column heads set to kNoElement
     * @throws InvalidCoordinate if dimension < 1
     */
    explicit LinkedSparseMatrix(int dimension);

    /**
     * @brief Place (row, col, value) in its row and column chains, or resolve a collision
     *
     * On collision the incumbent's value is replaced (REPLACE) or incremented (ADD) exactly
     * once and the store does not grow. Otherwise a new element with id nnz() + 1 is
     * appended and spliced into both chains.
     *
     * @throws InvalidCoordinate if row or col is outside [1, dimension()]
     * @throws InvalidMode if mode is not a known ResolveMode
     */
    InsertResult insert_or_resolve(int row, int col, Complex value, ResolveMode mode);

    InsertResult insert_or_resolve(Triplet const& triplet, ResolveMode mode) {
        return insert_or_resolve(triplet.row, triplet.col, triplet.value, mode);
    }

    int dimension() const noexcept { return dimension_; }
    int nnz() const noexcept { return static_cast<int>(elements_.size()); }
    bool empty() const noexcept { return elements_.empty(); }

    /**
     * @brief Head of a row chain, kNoElement for an empty row
     */
    int first_in_row(int row) const;

    /**
     * @brief Head of a column chain, kNoElement for an empty column
     */
    int first_in_col(int col) const;

    /**
     * @brief Element by id
     * @throws std::out_of_range for ids outside [1, nnz()]
     */
    Element const& element(int id) const;

    std::vector<Element> const& elements() const noexcept { return elements_; }

    /**
     * @brief Id of the element stored at (row, col), found by walking the row chain
     */
    std::optional<int> find(int row, int col) const;

    /**
     * @brief Stored value at (row, col), zero for structurally empty cells
     */
    Complex value_at(int row, int col) const;

    std::vector<int> row_chain(int row) const;
    std::vector<int> col_chain(int col) const;

    /**
     * @brief All stored entries, row by row in chain order
     */
    std::vector<Triplet> to_triplets() const;

    DenseMatrix to_dense() const;

    /**
     * @brief Export to 0-based CSR with sorted column indices
     */
    SparseMatrix to_csr() const;

    /**
     * @brief Verify chain ordering, head consistency and single reachability of every element
     * @param reason Receives a description of the first violation, if any
     */
    bool check_invariants(std::string* reason = nullptr) const;

    void reserve(std::size_t capacity) { elements_.reserve(capacity); }

  private:
    enum class Axis { ROW, COL };

    /**
     * @brief Position of a candidate inside one chain
     *
     * prev is the element the candidate follows (kNoElement: becomes the head), next the
     * element it precedes. incumbent is set when the chain already holds the cell.
     */
    struct ChainSlot {
        int prev{kNoElement};
        int next{kNoElement};
        int incumbent{kNoElement};
    };

    ChainSlot locate(Axis axis, int line, int key) const;
    void splice(Axis axis, int line, ChainSlot const& slot, int new_id);
    std::vector<int> chain(Axis axis, int line) const;
    bool check_axis(Axis axis, std::vector<int>& visits, std::string* reason) const;

    int head(Axis axis, int line) const;
    int& head(Axis axis, int line);
    static int next_link(Element const& element, Axis axis) noexcept;
    static int& next_link(Element& element, Axis axis) noexcept;
    static int line_of(Element const& element, Axis axis) noexcept;
    static int key_of(Element const& element, Axis axis) noexcept;
    static char const* axis_name(Axis axis) noexcept;

    void check_coordinate(int row, int col) const;
    Element& element_mut(int id) { return elements_[static_cast<std::size_t>(id - 1)]; }

    int dimension_;
    std::vector<int> first_in_row_;  // slot r-1 holds the head of row r
    std::vector<int> first_in_col_;  // slot c-1 holds the head of column c
    std::vector<Element> elements_;  // element id k lives at index k-1
};

}  // namespace ybus::sparse
