#pragma once

#include <complex>
#include <string>
#include <vector>

namespace ybus {

/**
 * @brief YBUS global precision
 *
 */
using Float = double;

/**
 * @brief Complex number type alias for admittance values
 */
using Complex = std::complex<Float>;

/**
 * @brief Vector of complex numbers
 */
using ComplexVector = std::vector<Complex>;

/**
 * @brief Sentinel used for "no element" in chain links and index heads
 */
inline constexpr int kNoElement = -1;

/**
 * @brief Collision resolution applied when a (row, col) cell is already occupied
 */
enum class ResolveMode {
    REPLACE = 0,  // Overwrite the incumbent value
    ADD = 1       // Accumulate into the incumbent value
};

/**
 * @brief Bus type enumeration for power system analysis
 */
enum class BusType {
    PQ = 0,    // Load bus (P and Q specified)
    PV = 1,    // Generator bus (P and V specified)
    SLACK = 2  // Slack/reference bus (V and angle specified)
};

/**
 * @brief Y-bus row/column ordering
 */
enum class BusOrdering {
    BUS_NUMBERS = 0,  // Table order
    BUS_TYPES = 1     // Slack, then PV, then PQ
};

/**
 * @brief One non-zero entry of a sparse matrix, 1-based coordinates
 */
struct Triplet {
    int row;
    int col;
    Complex value;
};

/**
 * @brief Dense complex matrix, row-major storage with 1-based accessors
 */
struct DenseMatrix {
    int num_rows{0};
    int num_cols{0};
    std::vector<Complex> data;

    DenseMatrix() = default;
    DenseMatrix(int rows, int cols)
        : num_rows(rows), num_cols(cols),
          data(static_cast<size_t>(rows) * static_cast<size_t>(cols), Complex(0.0, 0.0)) {}

    Complex& operator()(int row, int col) {
        return data[static_cast<size_t>(row - 1) * num_cols + (col - 1)];
    }
    Complex const& operator()(int row, int col) const {
        return data[static_cast<size_t>(row - 1) * num_cols + (col - 1)];
    }
};

/**
 * @brief Dense real matrix (B-matrix, incidence, branch susceptance)
 */
struct RealMatrix {
    int num_rows{0};
    int num_cols{0};
    std::vector<Float> data;

    RealMatrix() = default;
    RealMatrix(int rows, int cols)
        : num_rows(rows), num_cols(cols),
          data(static_cast<size_t>(rows) * static_cast<size_t>(cols), 0.0) {}

    Float& operator()(int row, int col) {
        return data[static_cast<size_t>(row - 1) * num_cols + (col - 1)];
    }
    Float operator()(int row, int col) const {
        return data[static_cast<size_t>(row - 1) * num_cols + (col - 1)];
    }
};

/**
 * @brief Sparse matrix structure in CSR format (0-based) for downstream solvers
 */
struct SparseMatrix {
    std::vector<int> row_ptr;     // Row pointers (CSR format)
    std::vector<int> col_idx;     // Column indices
    std::vector<Complex> values;  // Complex values
    int num_rows{0};              // Number of rows
    int num_cols{0};              // Number of columns
    int nnz{0};                   // Number of non-zero elements
};

/**
 * @brief Per-unit bus data (IEEE CDF bus card subset)
 */
struct BusData {
    int id;                         // Bus number - must be unique
    BusType bus_type{BusType::PQ};  // Bus type
    Float g_pu{0.0};                // Shunt conductance (p.u.)
    Float b_pu{0.0};                // Shunt susceptance (p.u.)
};

/**
 * @brief Per-unit branch data (IEEE CDF branch card subset)
 */
struct BranchData {
    int id;              // Branch ID
    int tap_bus;         // Tap-side bus number (off-nominal side)
    int z_bus;           // Impedance-side bus number
    Float r_pu{0.0};     // Series resistance (p.u.)
    Float x_pu{0.0};     // Series reactance (p.u.)
    Float b_pu{0.0};     // Total line charging susceptance (p.u.)
    Float tap{0.0};      // Transformer final turns ratio, 0 for lines
    Float shift{0.0};    // Transformer phase shift angle (degrees)
    bool in_service{true};
};

/**
 * @brief Power system network data container
 */
struct NetworkData {
    std::vector<BusData> buses;
    std::vector<BranchData> branches;
    std::string system_name{"unnamed"};

    int num_buses() const { return static_cast<int>(buses.size()); }
    int num_branches() const { return static_cast<int>(branches.size()); }
};

/**
 * @brief Convert ResolveMode enum to string
 */
inline std::string resolve_mode_to_string(ResolveMode mode) {
    switch (mode) {
        case ResolveMode::REPLACE:
            return "replace";
        case ResolveMode::ADD:
            return "add";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a resolution mode name ("replace" or "add")
 * @throws InvalidMode for any other string
 */
ResolveMode resolve_mode_from_string(std::string const& name);

/**
 * @brief Convert BusType enum to string
 */
inline std::string bus_type_to_string(BusType type) {
    switch (type) {
        case BusType::PQ:
            return "PQ";
        case BusType::PV:
            return "PV";
        case BusType::SLACK:
            return "SLACK";
        default:
            return "Unknown";
    }
}

}  // namespace ybus
