#pragma once

#include <stdexcept>
#include <string>

namespace ybus {

/**
 * @brief Row or column outside [1, N], or a non-positive dimension
 *
 * Thrown before any mutation. When raised from a build, triplet_index() is the 0-based
 * position of the offending triple in the input sequence, otherwise -1.
 */
class InvalidCoordinate : public std::out_of_range {
  public:
    InvalidCoordinate(int row, int col, int dimension, int triplet_index = -1)
        : std::out_of_range(make_message(row, col, dimension, triplet_index)),
          row_(row),
          col_(col),
          dimension_(dimension),
          triplet_index_(triplet_index) {}

    int row() const noexcept { return row_; }
    int col() const noexcept { return col_; }
    int dimension() const noexcept { return dimension_; }
    int triplet_index() const noexcept { return triplet_index_; }

  private:
    static std::string make_message(int row, int col, int dimension, int triplet_index) {
        std::string msg = "Invalid coordinate (" + std::to_string(row) + ", " +
                          std::to_string(col) + ") for dimension " + std::to_string(dimension);
        if (triplet_index >= 0) {
            msg += " at triplet " + std::to_string(triplet_index);
        }
        return msg;
    }

    int row_;
    int col_;
    int dimension_;
    int triplet_index_;
};

/**
 * @brief Unrecognised collision resolution mode
 */
class InvalidMode : public std::invalid_argument {
  public:
    explicit InvalidMode(std::string const& mode)
        : std::invalid_argument("Invalid resolve mode: \"" + mode +
                                "\" (expected \"replace\" or \"add\")"),
          mode_(mode) {}

    std::string const& mode() const noexcept { return mode_; }

  private:
    std::string mode_;
};

}  // namespace ybus
