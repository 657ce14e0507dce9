#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "ybus/core/builder_factory.h"
#include "ybus/core/types.h"
#include "ybus/logging/log_config.h"
#include "ybus/logging/logger.h"
#include "ybus/sparse/sparse_builder.h"

using namespace ybus;

/**
 * @brief Configuration structure for the application
 */
struct AppConfig {
    std::string input_file;
    std::string output_file;
    int dimension = 0;  // 0: inferred from the triples
    ResolveMode mode = ResolveMode::REPLACE;
    bool print_chains = false;
    bool verbose = false;
    bool trace = false;
    bool benchmark = false;
};

/**
 * @brief Print usage information
 */
void print_usage(char const* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "\nOPTIONS:\n"
              << "  -i, --input FILE      Triplet file, one \"row col re [im]\" per line (required)\n"
              << "  -o, --output FILE     Write the dense matrix as CSV\n"
              << "  -n, --dimension N     Matrix dimension (default: largest coordinate)\n"
              << "  -m, --mode MODE       Collision resolution: replace, add (default: replace)\n"
              << "  --chains              Print every row chain\n"
              << "  -v, --verbose         Enable verbose output\n"
              << "  --trace               Log every chain placement decision\n"
              << "  --benchmark           Report build time\n"
              << "  -h, --help            Show this help message\n"
              << "\nEXAMPLES:\n"
              << "  " << program_name << " -i ybus.txt -m add --chains\n"
              << "  " << program_name << " -i ybus.txt -n 14 -o ybus.csv -v\n"
              << std::endl;
}

/**
 * @brief Parse command line arguments
 */
AppConfig parse_arguments(int argc, char* argv[]) {
    AppConfig config;

    auto next_value = [&](int& i, std::string const& what) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing " + what + " argument");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-i" || arg == "--input") {
            config.input_file = next_value(i, "input file");
        } else if (arg == "-o" || arg == "--output") {
            config.output_file = next_value(i, "output file");
        } else if (arg == "-n" || arg == "--dimension") {
            config.dimension = std::stoi(next_value(i, "dimension"));
            if (config.dimension < 1) {
                throw std::invalid_argument("Dimension must be positive");
            }
        } else if (arg == "-m" || arg == "--mode") {
            config.mode = resolve_mode_from_string(next_value(i, "mode"));
        } else if (arg == "--chains") {
            config.print_chains = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--trace") {
            config.trace = true;
        } else if (arg == "--benchmark") {
            config.benchmark = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (config.input_file.empty()) {
        throw std::invalid_argument("Input file is required");
    }

    return config;
}

void print_chains(sparse::LinkedSparseMatrix const& matrix) {
    std::cout << "\nRow chains:" << std::endl;
    for (int row = 1; row <= matrix.dimension(); ++row) {
        std::cout << "  row " << row << " (FIR=" << matrix.first_in_row(row) << "):";
        for (int id : matrix.row_chain(row)) {
            auto const& e = matrix.element(id);
            std::cout << " [" << e.id << " c" << e.col << " " << e.value << "]";
        }
        std::cout << std::endl;
    }
}

/**
 * @brief Read triples, build the linked matrix, report
 */
int run_build(AppConfig const& config) {
    auto& logger = ybus::logging::global_logger;

    try {
        auto start_time = std::chrono::high_resolution_clock::now();

        auto io_module = core::BuilderFactory::create_io_module();
        logger.setComponent("YBUS");
        if (config.verbose) {
            LOG_INFO(logger, "Reading triplets from", config.input_file);
        }
        auto triplets = io_module->read_triplets(config.input_file);

        auto matrix = config.dimension > 0
                          ? sparse::build(triplets, config.dimension, config.mode)
                          : sparse::build(triplets, config.mode);

        std::string reason;
        if (!matrix.check_invariants(&reason)) {
            logger.setComponent("YBUS");
            LOG_ERROR(logger, "Chain invariant violated:", reason);
            return 1;
        }

        if (!config.output_file.empty()) {
            io_module->write_dense_csv(config.output_file, matrix.to_dense(), {});
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

        std::cout << "\nLinked Sparse Matrix Summary:" << std::endl;
        std::cout << "  Dimension: " << matrix.dimension() << std::endl;
        std::cout << "  Mode: " << resolve_mode_to_string(config.mode) << std::endl;
        std::cout << "  Triplets read: " << triplets.size() << std::endl;
        std::cout << "  Elements stored: " << matrix.nnz() << std::endl;
        std::cout << "  Collisions resolved: " << triplets.size() - matrix.nnz() << std::endl;

        if (config.print_chains) {
            print_chains(matrix);
        }

        if (config.benchmark) {
            std::cout << "  Execution time: " << duration.count() << " us" << std::endl;
        }

        return 0;

    } catch (std::exception const& e) {
        logger.setComponent("YBUS");
        LOG_ERROR(logger, "Error:", e.what());
        return 1;
    }
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        if (argc == 1) {
            std::cout << "YBUS Linked Sparse Matrix Builder\n" << std::endl;
            print_usage(argv[0]);
            return 0;
        }

        auto config = parse_arguments(argc, argv);

        logging::LogConfig::fromEnvironment();
        if (config.trace) {
            logging::LogConfig::enableTraceMode();
        } else if (config.verbose) {
            logging::LogConfig::forDevelopment();
        }

        int status = run_build(config);
        logging::global_logger.flush();
        return status;

    } catch (std::exception const& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
