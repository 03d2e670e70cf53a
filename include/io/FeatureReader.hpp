#pragma once

#include <Eigen/Dense>
#include <istream>
#include <string>
#include <vector>

#include "core/ClusterIndex.hpp"

namespace LoOP {

/**
 * @brief Numeric observations loaded from a delimited file.
 *
 * Rows are observations, columns are features. Missing cells are NaN.
 */
struct FeatureTable {
    std::vector<std::string> feature_names;  ///< Maps column index to header name
    Eigen::MatrixXd values;                  ///< n x d feature values, NaN for missing
    std::string label_name;                  ///< Header of the label column, empty if none
    std::vector<int> labels;                 ///< Cluster id per row, empty if no label column
    ClusterIndex cluster_index;              ///< Maps label text to the ids in labels

    int num_observations() const { return static_cast<int>(values.rows()); }
    int num_features() const { return static_cast<int>(values.cols()); }
    bool has_labels() const { return !labels.empty(); }

    /**
     * @brief Number of missing (NaN) cells.
     */
    int count_missing() const { return static_cast<int>(values.array().isNaN().count()); }
};

/**
 * @brief Options for FeatureReader.
 */
struct ReaderOptions {
    char delimiter = ',';
    bool has_header = true;
    std::string label_column;  ///< Header name or 0-based index; empty for none
};

/**
 * @brief Reads a delimited text file into a FeatureTable.
 *
 * Cells are trimmed of surrounding whitespace. Empty cells and the tokens
 * NA, NaN, nan and null are read as missing values. Blank lines are skipped.
 */
class FeatureReader {
public:
    explicit FeatureReader(const ReaderOptions& options = ReaderOptions()) : options_(options) {}

    /**
     * @brief Reads a file.
     *
     * @throws std::runtime_error if the file cannot be opened or is malformed
     *         (non-numeric cell, wrong number of cells, no data rows, unknown
     *         label column). The message names the file, line and column.
     */
    FeatureTable read(const std::string& path) const;

    /**
     * @brief Reads from an open stream; source_name is used in error messages.
     */
    FeatureTable read(std::istream& in, const std::string& source_name) const;

    /**
     * @brief True for the tokens treated as a missing value.
     */
    static bool is_missing_token(const std::string& token);

    const ReaderOptions& options() const { return options_; }

private:
    ReaderOptions options_;

    std::vector<std::string> split_line(const std::string& line) const;
    int resolve_label_column(const std::vector<std::string>& header, int num_columns,
                             const std::string& source_name) const;
};

}  // namespace LoOP
