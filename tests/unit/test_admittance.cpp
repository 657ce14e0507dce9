#include <cmath>
#include <numbers>
#include <stdexcept>

#include "ybus/admittance/admittance_interface.h"
#include "ybus/core/builder_factory.h"

#include "test_framework.h"

using namespace ybus;
using namespace ybus::admittance;

namespace {

NetworkData two_bus_network() {
    NetworkData network;
    network.system_name = "two bus";
    network.buses = {{.id = 1, .bus_type = BusType::SLACK},
                     {.id = 2, .bus_type = BusType::PQ, .g_pu = 0.0, .b_pu = 0.05}};
    network.branches = {
        {.id = 1, .tap_bus = 1, .z_bus = 2, .r_pu = 0.01, .x_pu = 0.1, .b_pu = 0.02}};
    return network;
}

// Radial 1 - 2 - 3 with bus types listed out of order
NetworkData three_bus_network() {
    NetworkData network;
    network.system_name = "three bus";
    network.buses = {{.id = 1, .bus_type = BusType::PQ},
                     {.id = 2, .bus_type = BusType::PV},
                     {.id = 3, .bus_type = BusType::SLACK}};
    network.branches = {
        {.id = 1, .tap_bus = 1, .z_bus = 2, .r_pu = 0.02, .x_pu = 0.06, .b_pu = 0.03},
        {.id = 2, .tap_bus = 2, .z_bus = 3, .r_pu = 0.05, .x_pu = 0.2, .b_pu = 0.02}};
    return network;
}

}  // namespace

void test_admittance_builder_creation() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    ASSERT_TRUE(builder != nullptr);
}

void test_two_bus_ybus() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = two_bus_network();

    auto result = builder->build_ybus(network, {});
    ASSERT_TRUE(result != nullptr);
    ASSERT_EQ(2, result->ybus.num_rows);
    ASSERT_EQ(2, result->sparse.dimension());
    ASSERT_EQ(4, result->sparse.nnz());

    Complex y = Complex(1.0, 0.0) / Complex(0.01, 0.1);
    ASSERT_NEAR(y + Complex(0.0, 0.01), result->ybus(1, 1), 1e-12);
    ASSERT_NEAR(y + Complex(0.0, 0.01) + Complex(0.0, 0.05), result->ybus(2, 2), 1e-12);
    ASSERT_NEAR(-y, result->ybus(1, 2), 1e-12);
    ASSERT_NEAR(-y, result->ybus(2, 1), 1e-12);

    // Row sums of a line without charging or shunts vanish
    ASSERT_NEAR(Complex(0.0, 0.01), result->ybus(1, 1) + result->ybus(1, 2), 1e-12);
}

void test_triplet_contributions() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = three_bus_network();

    auto triplets = builder->build_triplets(network, {});
    ASSERT_EQ(4 * 2 + 3, static_cast<int>(triplets.size()));

    // Branch stamps first: (tap, tap), (z, z), (tap, z), (z, tap)
    ASSERT_EQ(1, triplets[0].row);
    ASSERT_EQ(1, triplets[0].col);
    ASSERT_EQ(2, triplets[1].row);
    ASSERT_EQ(2, triplets[1].col);
    ASSERT_EQ(1, triplets[2].row);
    ASSERT_EQ(2, triplets[2].col);
    ASSERT_EQ(2, triplets[3].row);
    ASSERT_EQ(1, triplets[3].col);

    // Bus 2 collects two branch diagonals and a shunt, so its cell is hit three times
    int hits = 0;
    for (auto const& t : triplets) {
        if (t.row == 2 && t.col == 2) ++hits;
    }
    ASSERT_EQ(3, hits);
}

void test_sparse_matches_dense() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = three_bus_network();

    auto result = builder->build_ybus(network, {});
    ASSERT_TRUE(result->sparse.check_invariants());
    ASSERT_EQ(7, result->sparse.nnz());  // 3 diagonals + 2 pairs of off-diagonals

    for (int row = 1; row <= 3; ++row) {
        for (int col = 1; col <= 3; ++col) {
            ASSERT_NEAR(result->ybus(row, col), result->sparse.value_at(row, col), 1e-12);
        }
    }
    ASSERT_FALSE(result->sparse.find(1, 3).has_value());
    ASSERT_FALSE(result->sparse.find(3, 1).has_value());
}

void test_symmetric_without_phase_shift() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = three_bus_network();
    network.branches[0].tap = 0.97;

    auto result = builder->build_ybus(network, {});
    for (int row = 1; row <= 3; ++row) {
        for (int col = 1; col <= 3; ++col) {
            ASSERT_NEAR(result->ybus(row, col), result->ybus(col, row), 1e-12);
        }
    }
}

void test_off_nominal_tap() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = two_bus_network();
    network.branches[0].b_pu = 0.0;
    network.buses[1].b_pu = 0.0;
    network.branches[0].tap = 0.95;

    Complex y = Complex(1.0, 0.0) / Complex(0.01, 0.1);

    auto result = builder->build_ybus(network, {});
    ASSERT_NEAR(y / (0.95 * 0.95), result->ybus(1, 1), 1e-12);
    ASSERT_NEAR(y, result->ybus(2, 2), 1e-12);
    ASSERT_NEAR(-y / 0.95, result->ybus(1, 2), 1e-12);
    ASSERT_NEAR(-y / 0.95, result->ybus(2, 1), 1e-12);

    YbusOptions options;
    options.disable_taps = true;
    auto untapped = builder->build_ybus(network, options);
    ASSERT_NEAR(y, untapped->ybus(1, 1), 1e-12);
    ASSERT_NEAR(-y, untapped->ybus(1, 2), 1e-12);
}

void test_phase_shifter() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = two_bus_network();
    network.branches[0].b_pu = 0.0;
    network.buses[1].b_pu = 0.0;
    network.branches[0].tap = 1.0;
    network.branches[0].shift = 30.0;

    Complex y = Complex(1.0, 0.0) / Complex(0.01, 0.1);
    Complex a = std::polar(1.0, std::numbers::pi / 6.0);

    auto result = builder->build_ybus(network, {});
    ASSERT_NEAR(y, result->ybus(1, 1), 1e-12);
    ASSERT_NEAR(-y / std::conj(a), result->ybus(1, 2), 1e-12);
    ASSERT_NEAR(-y / a, result->ybus(2, 1), 1e-12);
    ASSERT_TRUE(std::abs(result->ybus(1, 2) - result->ybus(2, 1)) > 1e-3);
}

void test_companion_matrices() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = three_bus_network();

    auto result = builder->build_ybus(network, {});

    ASSERT_EQ(3, result->b_matrix.num_rows);
    for (int row = 1; row <= 3; ++row) {
        for (int col = 1; col <= 3; ++col) {
            ASSERT_NEAR(-result->ybus(row, col).imag(), result->b_matrix(row, col), 1e-15);
        }
    }

    ASSERT_EQ(2, result->branch_susceptance.num_rows);
    ASSERT_NEAR(1.0 / 0.06, result->branch_susceptance(1, 1), 1e-12);
    ASSERT_NEAR(1.0 / 0.2, result->branch_susceptance(2, 2), 1e-12);
    ASSERT_NEAR(0.0, result->branch_susceptance(1, 2), 1e-15);

    ASSERT_EQ(2, result->incidence.num_rows);
    ASSERT_EQ(3, result->incidence.num_cols);
    ASSERT_NEAR(1.0, result->incidence(1, 1), 1e-15);
    ASSERT_NEAR(-1.0, result->incidence(1, 2), 1e-15);
    ASSERT_NEAR(0.0, result->incidence(1, 3), 1e-15);
    ASSERT_NEAR(1.0, result->incidence(2, 2), 1e-15);
    ASSERT_NEAR(-1.0, result->incidence(2, 3), 1e-15);

    ASSERT_EQ(std::string("1 to 2"), result->branch_names[0]);
    ASSERT_EQ(std::string("2 to 3"), result->branch_names[1]);

    ASSERT_TRUE(result->adjacency[0] == std::vector<int>({2, 1}));
    ASSERT_TRUE(result->adjacency[1] == std::vector<int>({1, 3, 2}));
    ASSERT_TRUE(result->adjacency[2] == std::vector<int>({2, 3}));

    ASSERT_TRUE(result->bus_order == std::vector<int>({1, 2, 3}));
    ASSERT_EQ(std::string("1"), result->row_labels[0]);
}

void test_bus_type_ordering() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = three_bus_network();

    YbusOptions options;
    options.ordering = BusOrdering::BUS_TYPES;
    auto ordered = builder->build_ybus(network, options);
    auto plain = builder->build_ybus(network, {});

    ASSERT_TRUE(ordered->bus_order == std::vector<int>({3, 2, 1}));
    ASSERT_EQ(std::string("3"), ordered->row_labels[0]);
    ASSERT_EQ(std::string("1"), ordered->row_labels[2]);

    // Same network, permuted rows and columns
    ASSERT_NEAR(plain->ybus(3, 3), ordered->ybus(1, 1), 1e-12);
    ASSERT_NEAR(plain->ybus(1, 2), ordered->ybus(3, 2), 1e-12);
    ASSERT_NEAR(plain->ybus(2, 3), ordered->ybus(2, 1), 1e-12);
    ASSERT_NEAR(1.0, ordered->incidence(1, 3), 1e-15);
    ASSERT_NEAR(-1.0, ordered->incidence(1, 2), 1e-15);
}

void test_skipped_branches() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = three_bus_network();
    network.branches[1].in_service = false;
    network.branches.push_back(
        {.id = 3, .tap_bus = 1, .z_bus = 99, .r_pu = 0.01, .x_pu = 0.1, .b_pu = 0.0});

    auto triplets = builder->build_triplets(network, {});
    ASSERT_EQ(4 + 3, static_cast<int>(triplets.size()));

    auto result = builder->build_ybus(network, {});
    ASSERT_EQ(5, result->sparse.nnz());
    ASSERT_NEAR(Complex(0.0, 0.0), result->ybus(3, 3), 1e-15);
    ASSERT_EQ(3, static_cast<int>(result->branch_names.size()));
    ASSERT_EQ(std::string("1 to 99"), result->branch_names[2]);
    ASSERT_NEAR(0.0, result->incidence(2, 2), 1e-15);
    ASSERT_TRUE(result->adjacency[2] == std::vector<int>({3}));
}

void test_invalid_networks() {
    auto builder = core::BuilderFactory::create_admittance_builder();

    NetworkData empty;
    ASSERT_THROWS(builder->build_ybus(empty, {}), std::invalid_argument);

    auto duplicate = three_bus_network();
    duplicate.buses[2].id = 1;
    ASSERT_THROWS(builder->build_triplets(duplicate, {}), std::invalid_argument);
}

void test_update_branch_status() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = three_bus_network();
    auto result = builder->build_ybus(network, {});
    auto& matrix = result->sparse;
    Complex original_12 = matrix.value_at(1, 2);
    Complex original_22 = matrix.value_at(2, 2);

    BranchData outage = network.branches[0];
    outage.in_service = false;
    builder->update_ybus(matrix, network, {outage}, {});

    ASSERT_EQ(7, matrix.nnz());
    ASSERT_NEAR(Complex(0.0, 0.0), matrix.value_at(1, 2), 1e-12);
    ASSERT_NEAR(Complex(0.0, 0.0), matrix.value_at(1, 1), 1e-12);
    // Only the 2 - 3 line is left on bus 2
    Complex y23 = Complex(1.0, 0.0) / Complex(0.05, 0.2);
    ASSERT_NEAR(y23 + Complex(0.0, 0.01), matrix.value_at(2, 2), 1e-12);

    BranchData restore = network.branches[0];
    builder->update_ybus(matrix, network, {restore}, {});
    ASSERT_NEAR(original_12, matrix.value_at(1, 2), 1e-12);
    ASSERT_NEAR(original_22, matrix.value_at(2, 2), 1e-12);
    ASSERT_TRUE(matrix.check_invariants());
}

void test_update_creates_new_cells() {
    auto builder = core::BuilderFactory::create_admittance_builder();
    auto network = three_bus_network();
    auto result = builder->build_ybus(network, {});
    auto& matrix = result->sparse;

    BranchData tie = {.id = 3, .tap_bus = 1, .z_bus = 3, .r_pu = 0.0, .x_pu = 0.25};
    builder->update_ybus(matrix, network, {tie}, {});

    ASSERT_EQ(9, matrix.nnz());
    ASSERT_NEAR(Complex(0.0, 4.0), matrix.value_at(1, 3), 1e-12);
    ASSERT_NEAR(Complex(0.0, 4.0), matrix.value_at(3, 1), 1e-12);
    ASSERT_TRUE(matrix.check_invariants());

    sparse::LinkedSparseMatrix small(2);
    ASSERT_THROWS(builder->update_ybus(small, network, {tie}, {}), std::invalid_argument);
}

void register_admittance_tests(TestRunner& runner) {
    runner.add_test("Admittance Builder Creation", test_admittance_builder_creation);
    runner.add_test("Two Bus Y-bus", test_two_bus_ybus);
    runner.add_test("Triplet Contributions", test_triplet_contributions);
    runner.add_test("Sparse Matches Dense", test_sparse_matches_dense);
    runner.add_test("Symmetric Without Phase Shift", test_symmetric_without_phase_shift);
    runner.add_test("Off Nominal Tap", test_off_nominal_tap);
    runner.add_test("Phase Shifter", test_phase_shifter);
    runner.add_test("Companion Matrices", test_companion_matrices);
    runner.add_test("Bus Type Ordering", test_bus_type_ordering);
    runner.add_test("Skipped Branches", test_skipped_branches);
    runner.add_test("Invalid Networks", test_invalid_networks);
    runner.add_test("Update Branch Status", test_update_branch_status);
    runner.add_test("Update Creates New Cells", test_update_creates_new_cells);
}
