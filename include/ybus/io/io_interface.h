#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ybus/core/types.h"

namespace ybus::io {

/**
 * @brief Abstract interface for input/output operations
 */
class IIOModule {
  public:
    virtual ~IIOModule() = default;

    /**
     * @brief Read triples from a whitespace separated text file
     *
     * One "row col re [im]" entry per line; blank lines and lines starting with '#' are
     * skipped. Order of the file is preserved.
     *
     * @param filename Path to the input file
     * @return Triples in file order
     */
    virtual std::vector<Triplet> read_triplets(std::string const& filename) = 0;

    /**
     * @brief Write triples in the format accepted by read_triplets
     */
    virtual void write_triplets(std::string const& filename,
                                std::vector<Triplet> const& triplets) = 0;

    /**
     * @brief Write a dense complex matrix as CSV
     * @param filename Path to the output file
     * @param matrix Matrix to write
     * @param labels Column headers, bus numbers when empty
     */
    virtual void write_dense_csv(std::string const& filename, DenseMatrix const& matrix,
                                 std::vector<std::string> const& labels) = 0;

    /**
     * @brief Write a dense real matrix as CSV
     */
    virtual void write_real_csv(std::string const& filename, RealMatrix const& matrix,
                                std::vector<std::string> const& labels) = 0;

    /**
     * @brief Check that every non-comment line of a file parses as a triple
     */
    virtual bool validate_input_format(std::string const& filename) = 0;
};

}  // namespace ybus::io
