#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "ybus/admittance/admittance_interface.h"
#include "ybus/logging/logger.h"
#include "ybus/sparse/sparse_builder.h"

namespace ybus::admittance {

class CPUAdmittanceBuilder : public IAdmittanceBuilder {
  private:
    // Admittance contributions of a single branch between two positions
    struct BranchStamp {
        int tap_pos;
        int z_pos;
        Complex y_tap_tap;
        Complex y_z_z;
        Complex y_tap_z;
        Complex y_z_tap;
    };

    // Bus number -> 1-based position in the requested ordering
    std::unordered_map<int, int> map_bus_positions(NetworkData const& network_data,
                                                   BusOrdering ordering,
                                                   std::vector<int>& bus_order) const {
        std::vector<int> table_order(network_data.buses.size());
        for (size_t idx = 0; idx < table_order.size(); ++idx) {
            table_order[idx] = static_cast<int>(idx);
        }

        if (ordering == BusOrdering::BUS_TYPES) {
            auto rank = [](BusType type) {
                switch (type) {
                    case BusType::SLACK:
                        return 0;
                    case BusType::PV:
                        return 1;
                    default:
                        return 2;
                }
            };
            std::ranges::stable_sort(table_order, [&](int a, int b) {
                return rank(network_data.buses[a].bus_type) < rank(network_data.buses[b].bus_type);
            });
        }

        std::unordered_map<int, int> positions;
        bus_order.clear();
        for (size_t pos = 0; pos < table_order.size(); ++pos) {
            int bus_id = network_data.buses[table_order[pos]].id;
            if (!positions.emplace(bus_id, static_cast<int>(pos) + 1).second) {
                throw std::invalid_argument("Duplicate bus number " + std::to_string(bus_id));
            }
            bus_order.push_back(bus_id);
        }
        return positions;
    }

    // Returns false for branches whose buses are not in the network
    bool stamp_branch(BranchData const& branch, std::unordered_map<int, int> const& positions,
                      bool disable_taps, BranchStamp& stamp) const {
        auto& logger = ybus::logging::global_logger;

        auto tap_it = positions.find(branch.tap_bus);
        auto z_it = positions.find(branch.z_bus);
        if (tap_it == positions.end() || z_it == positions.end()) {
            LOG_WARN(logger, "  Skipping branch", branch.id, "with unknown buses:", branch.tap_bus,
                     "->", branch.z_bus);
            return false;
        }

        Complex series_admittance(0.0, 0.0);
        Float z_magnitude_sq = branch.r_pu * branch.r_pu + branch.x_pu * branch.x_pu;
        if (z_magnitude_sq > 1e-12) {
            series_admittance = Complex(1.0, 0.0) / Complex(branch.r_pu, branch.x_pu);
        } else {
            LOG_WARN(logger, "  Branch", branch.id, "has zero impedance, series part ignored");
        }

        // Off-nominal tap on the tap-side bus; lines carry tap 0
        Complex a(1.0, 0.0);
        if (!disable_taps && branch.tap != 0.0) {
            a = std::polar(branch.tap, branch.shift * std::numbers::pi / 180.0);
        }
        Complex const half_charging(0.0, branch.b_pu / 2.0);

        stamp.tap_pos = tap_it->second;
        stamp.z_pos = z_it->second;
        stamp.y_tap_tap = series_admittance / std::norm(a) + half_charging;
        stamp.y_z_z = series_admittance + half_charging;
        stamp.y_tap_z = -series_admittance / std::conj(a);
        stamp.y_z_tap = -series_admittance / a;
        return true;
    }

    static void append_stamp(std::vector<Triplet>& triplets, BranchStamp const& stamp,
                             Float sign) {
        triplets.push_back({stamp.tap_pos, stamp.tap_pos, sign * stamp.y_tap_tap});
        triplets.push_back({stamp.z_pos, stamp.z_pos, sign * stamp.y_z_z});
        triplets.push_back({stamp.tap_pos, stamp.z_pos, sign * stamp.y_tap_z});
        triplets.push_back({stamp.z_pos, stamp.tap_pos, sign * stamp.y_z_tap});
    }

    static void check_network(NetworkData const& network_data) {
        if (network_data.buses.empty()) {
            throw std::invalid_argument("Network '" + network_data.system_name +
                                        "' has no buses");
        }
    }

  public:
    std::vector<Triplet> build_triplets(NetworkData const& network_data,
                                        YbusOptions const& options) override {
        check_network(network_data);

        std::vector<int> bus_order;
        auto positions = map_bus_positions(network_data, options.ordering, bus_order);

        std::vector<Triplet> triplets;
        triplets.reserve(4 * network_data.branches.size() + network_data.buses.size());

        for (auto const& branch : network_data.branches) {
            if (!branch.in_service) {
                continue;
            }
            BranchStamp stamp{};
            if (stamp_branch(branch, positions, options.disable_taps, stamp)) {
                append_stamp(triplets, stamp, 1.0);
            }
        }

        for (auto const& bus : network_data.buses) {
            int pos = positions.at(bus.id);
            triplets.push_back({pos, pos, Complex(bus.g_pu, bus.b_pu)});
        }

        return triplets;
    }

    std::unique_ptr<YbusResult> build_ybus(NetworkData const& network_data,
                                           YbusOptions const& options) override {
        auto start_time = std::chrono::high_resolution_clock::now();

        auto& logger = ybus::logging::global_logger;
        logger.setComponent("CPUAdmittanceBuilder");
        LOG_INFO(logger, "Building Y-bus for", network_data.system_name);
        LOG_INFO(logger, "  Number of buses:", network_data.num_buses());
        LOG_INFO(logger, "  Number of branches:", network_data.num_branches());

        auto triplets = build_triplets(network_data, options);
        int const n = network_data.num_buses();
        int const num_branches = network_data.num_branches();

        auto result = std::make_unique<YbusResult>(
            sparse::build(triplets, n, ResolveMode::ADD));
        auto positions = map_bus_positions(network_data, options.ordering, result->bus_order);
        logger.setComponent("CPUAdmittanceBuilder");

        // Dense Y-bus and B-matrix, with round-off flushed to zero
        result->ybus = result->sparse.to_dense();
        result->b_matrix = RealMatrix(n, n);
        for (int row = 1; row <= n; ++row) {
            for (int col = 1; col <= n; ++col) {
                Complex& value = result->ybus(row, col);
                if (std::abs(value) < options.zero_tolerance) {
                    value = Complex(0.0, 0.0);
                }
                result->b_matrix(row, col) = -value.imag();
            }
        }

        // Branch-level companions
        result->branch_susceptance = RealMatrix(num_branches, num_branches);
        result->incidence = RealMatrix(num_branches, n);
        result->branch_names.reserve(network_data.branches.size());
        result->adjacency.assign(static_cast<size_t>(n), {});

        for (int l = 1; l <= num_branches; ++l) {
            auto const& branch = network_data.branches[static_cast<size_t>(l - 1)];
            result->branch_names.push_back(std::to_string(branch.tap_bus) + " to " +
                                           std::to_string(branch.z_bus));
            if (branch.x_pu != 0.0) {
                result->branch_susceptance(l, l) = 1.0 / branch.x_pu;
            }

            auto tap_it = positions.find(branch.tap_bus);
            auto z_it = positions.find(branch.z_bus);
            if (!branch.in_service || tap_it == positions.end() || z_it == positions.end()) {
                continue;
            }
            result->incidence(l, tap_it->second) = 1.0;
            result->incidence(l, z_it->second) = -1.0;
            result->adjacency[static_cast<size_t>(tap_it->second - 1)].push_back(z_it->second);
            result->adjacency[static_cast<size_t>(z_it->second - 1)].push_back(tap_it->second);
        }

        for (int pos = 1; pos <= n; ++pos) {
            result->adjacency[static_cast<size_t>(pos - 1)].push_back(pos);
            result->row_labels.push_back(std::to_string(result->bus_order[pos - 1]));
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        LOG_INFO(logger, "  Y-bus constructed with", result->sparse.nnz(), "non-zero elements from",
                 triplets.size(), "contributions");
        LOG_DEBUG(logger, "  Build time:",
                  std::chrono::duration<double, std::milli>(end_time - start_time).count(), "ms");

        return result;
    }

    void update_ybus(sparse::LinkedSparseMatrix& matrix, NetworkData const& network_data,
                     std::vector<BranchData> const& branch_changes,
                     YbusOptions const& options) override {
        auto& logger = ybus::logging::global_logger;
        logger.setComponent("CPUAdmittanceBuilder");
        LOG_INFO(logger, "Updating Y-bus");
        LOG_INFO(logger, "  Branch changes:", branch_changes.size());

        check_network(network_data);
        if (matrix.dimension() != network_data.num_buses()) {
            throw std::invalid_argument("Y-bus dimension " + std::to_string(matrix.dimension()) +
                                        " does not match " +
                                        std::to_string(network_data.num_buses()) + " buses");
        }

        std::vector<int> bus_order;
        auto positions = map_bus_positions(network_data, options.ordering, bus_order);

        std::vector<Triplet> delta;
        delta.reserve(4 * branch_changes.size());
        for (auto const& change : branch_changes) {
            BranchStamp stamp{};
            if (!stamp_branch(change, positions, options.disable_taps, stamp)) {
                continue;
            }
            LOG_DEBUG(logger, "  Branch", change.id, change.tap_bus, "->", change.z_bus,
                      change.in_service ? "in service" : "out of service");
            append_stamp(delta, stamp, change.in_service ? 1.0 : -1.0);
        }

        for (auto const& triplet : delta) {
            matrix.insert_or_resolve(triplet, ResolveMode::ADD);
        }

        LOG_INFO(logger, "  Y-bus update completed,", matrix.nnz(), "elements");
    }
};

std::unique_ptr<IAdmittanceBuilder> create_cpu_admittance_builder() {
    return std::make_unique<CPUAdmittanceBuilder>();
}

}  // namespace ybus::admittance
