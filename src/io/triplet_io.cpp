#include <fstream>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "ybus/io/io_interface.h"
#include "ybus/logging/logger.h"

namespace ybus::io {

namespace {

/**
 * @brief Parse one data line, false when it is blank or a comment
 * @throws std::runtime_error on malformed content
 */
bool parse_triplet_line(std::string const& line, Triplet& triplet) {
    auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') {
        return false;
    }

    std::istringstream iss(line);
    Float re = 0.0;
    Float im = 0.0;
    if (!(iss >> triplet.row >> triplet.col >> re)) {
        throw std::runtime_error("expected \"row col re [im]\"");
    }
    if (!(iss >> im)) {
        if (!iss.eof()) {
            throw std::runtime_error("imaginary part is not a number");
        }
        im = 0.0;
    }
    iss.clear();
    std::string trailing;
    if (iss >> trailing) {
        throw std::runtime_error("unexpected trailing token '" + trailing + "'");
    }
    triplet.value = Complex(re, im);
    return true;
}

std::string format_complex(Complex const& value) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<Float>::max_digits10) << value.real()
        << (value.imag() < 0.0 ? "-" : "+") << std::abs(value.imag()) << "j";
    return oss.str();
}

template <typename Matrix, typename Formatter>
void write_csv(std::string const& filename, Matrix const& matrix,
               std::vector<std::string> const& labels, Formatter&& format) {
    if (!labels.empty() && static_cast<int>(labels.size()) != matrix.num_cols) {
        throw std::invalid_argument("Expected " + std::to_string(matrix.num_cols) +
                                    " labels, got " + std::to_string(labels.size()));
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }

    for (int col = 1; col <= matrix.num_cols; ++col) {
        if (col > 1) file << ",";
        file << (labels.empty() ? std::to_string(col) : labels[static_cast<size_t>(col - 1)]);
    }
    file << "\n";

    for (int row = 1; row <= matrix.num_rows; ++row) {
        for (int col = 1; col <= matrix.num_cols; ++col) {
            if (col > 1) file << ",";
            file << format(matrix(row, col));
        }
        file << "\n";
    }

    if (!file) {
        throw std::runtime_error("Failed while writing " + filename);
    }
}

}  // namespace

class TripletIOModule : public IIOModule {
  public:
    std::vector<Triplet> read_triplets(std::string const& filename) override {
        auto& logger = ybus::logging::global_logger;

        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open input file: " + filename);
        }

        std::vector<Triplet> triplets;
        std::string line;
        int line_number = 0;
        while (std::getline(file, line)) {
            ++line_number;
            Triplet triplet{};
            try {
                if (parse_triplet_line(line, triplet)) {
                    triplets.push_back(triplet);
                }
            } catch (std::runtime_error const& e) {
                throw std::runtime_error(filename + ":" + std::to_string(line_number) + ": " +
                                         e.what());
            }
        }

        LOG_INFO(logger, "Read", triplets.size(), "triplets from", filename);
        return triplets;
    }

    void write_triplets(std::string const& filename,
                        std::vector<Triplet> const& triplets) override {
        std::ofstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + filename);
        }

        file << "# row col re im\n";
        file << std::setprecision(std::numeric_limits<Float>::max_digits10);
        for (auto const& t : triplets) {
            file << t.row << " " << t.col << " " << t.value.real() << " " << t.value.imag()
                 << "\n";
        }

        if (!file) {
            throw std::runtime_error("Failed while writing " + filename);
        }
    }

    void write_dense_csv(std::string const& filename, DenseMatrix const& matrix,
                         std::vector<std::string> const& labels) override {
        write_csv(filename, matrix, labels, format_complex);
        LOG_INFO(ybus::logging::global_logger, "Wrote", matrix.num_rows, "x", matrix.num_cols,
                 "matrix to", filename);
    }

    void write_real_csv(std::string const& filename, RealMatrix const& matrix,
                        std::vector<std::string> const& labels) override {
        write_csv(filename, matrix, labels, [](Float value) {
            std::ostringstream oss;
            oss << std::setprecision(std::numeric_limits<Float>::max_digits10) << value;
            return oss.str();
        });
        LOG_INFO(ybus::logging::global_logger, "Wrote", matrix.num_rows, "x", matrix.num_cols,
                 "matrix to", filename);
    }

    bool validate_input_format(std::string const& filename) override {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            Triplet triplet{};
            try {
                parse_triplet_line(line, triplet);
            } catch (std::runtime_error const&) {
                return false;
            }
        }
        return true;
    }
};

std::unique_ptr<IIOModule> create_triplet_io_module() { return std::make_unique<TripletIOModule>(); }

}  // namespace ybus::io
