#pragma once

#include "clam/dataset.hpp"
#include "clam/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace clam {
namespace io {

/**
 * @brief Reads numeric rows from a delimited text file.
 *
 * Blank lines and lines starting with '#' are skipped. Every row must have
 * the same number of columns.
 *
 * @throws IOError when the file cannot be opened
 * @throws ParseError for a non-numeric field or a ragged row
 */
std::vector<DenseVector> load_dense_csv(const std::string& path, char delimiter = ',');

/**
 * @brief Reads a 2-D little-endian, C-order NumPy array ('<f4' or '<f8').
 *
 * float64 data is narrowed to float32.
 */
std::vector<DenseVector> load_npy(const std::string& path);

// ".npy" goes to load_npy, ".tsv" to tab-separated, anything else to CSV
std::vector<DenseVector> load_dense(const std::string& path);

// One instance per line; blank lines are skipped
std::vector<std::string> load_strings(const std::string& path);

// Datasets named after the file stem
std::shared_ptr<const DenseDataset> load_dense_dataset(const std::string& path);
std::shared_ptr<const StringDataset> load_string_dataset(const std::string& path);

} // namespace io
} // namespace clam
