#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ybus/core/types.h"
#include "ybus/sparse/linked_sparse_matrix.h"

namespace ybus::admittance {

/**
 * @brief Y-bus construction options
 */
struct YbusOptions {
    bool disable_taps{false};                        // Treat every tap ratio as 1
    BusOrdering ordering{BusOrdering::BUS_NUMBERS};  // Row/column order of the outputs
    Float zero_tolerance{1e-12};                     // Dense entries below this become 0
};

/**
 * @brief Y-bus and the companion matrices derived from the same network
 *
 * All matrices use the row/column order given by bus_order.
 */
struct YbusResult {
    explicit YbusResult(sparse::LinkedSparseMatrix matrix) : sparse(std::move(matrix)) {}

    sparse::LinkedSparseMatrix sparse;           // Linked Y-bus accumulated with ADD
    DenseMatrix ybus;                            // Dense Y-bus
    RealMatrix b_matrix;                         // -imag(Y)
    RealMatrix branch_susceptance;               // Diagonal 1/X per branch
    RealMatrix incidence;                        // Branch x bus, +1 tap side, -1 impedance side
    std::vector<std::string> branch_names;       // "i to k" in bus numbers
    std::vector<std::vector<int>> adjacency;     // Neighbour positions, then the bus itself
    std::vector<std::string> row_labels;         // Bus number per position
    std::vector<int> bus_order;                  // Bus number per position
};

/**
 * @brief Abstract interface for admittance matrix calculation
 */
class IAdmittanceBuilder {
  public:
    virtual ~IAdmittanceBuilder() = default;

    /**
     * @brief Admittance contributions as triples, to be accumulated with ResolveMode::ADD
     *
     * Four triples per in-service branch followed by one diagonal shunt triple per bus.
     * Coordinates are 1-based positions in the requested ordering.
     */
    virtual std::vector<Triplet> build_triplets(NetworkData const& network_data,
                                                YbusOptions const& options) = 0;

    /**
     * @brief Build the linked Y-bus and the dense companion matrices
     */
    virtual std::unique_ptr<YbusResult> build_ybus(NetworkData const& network_data,
                                                   YbusOptions const& options) = 0;

    /**
     * @brief Apply branch status changes to an existing Y-bus in place
     *
     * Branches with in_service == false have their contributions subtracted, in-service
     * ones added. Cells that were structurally empty are created.
     */
    virtual void update_ybus(sparse::LinkedSparseMatrix& matrix, NetworkData const& network_data,
                             std::vector<BranchData> const& branch_changes,
                             YbusOptions const& options) = 0;
};

}  // namespace ybus::admittance
