#pragma once

#include <string>

#include "ProbabilityPipeline.hpp"
#include "Types.hpp"

namespace LoOP {

/**
 * @brief Configuration structure holding all runtime parameters of the CLI.
 *
 * Validated by both CLI11 (basic checks) and the validate() method (ranges and
 * relationships). Checks that depend on the data, such as n_neighbors against
 * the smallest cluster, are left to the pipeline.
 */
struct Config {
    // Input/Output
    std::string input_path;             ///< Delimited feature file (Required)
    std::string output_dir = "output";  ///< Output directory for results
    std::string label_column;           ///< Cluster label column, by name or 0-based index (Optional)
    char delimiter = ',';               ///< Field delimiter of the input file
    bool has_header = true;             ///< First line holds column names

    // LoOP Parameters
    double extent = 0.997;  ///< Statistical extent in (0, 1]
    int n_neighbors = 10;   ///< Neighborhood size per observation
    int threads = 1;        ///< Number of threads for distance computation

    // Output
    int precision = 6;              ///< Decimal places for scores
    bool write_statistics = false;  ///< Also write the per-observation statistics table

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< Mirror log records to this file (Optional)
    bool use_color = true;                    ///< ANSI colors when writing to a terminal

    /**
     * @brief Validates parameter ranges.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    /**
     * @brief Parameters for LocalOutlierProbability.
     */
    LoopConfig to_loop_config() const;

    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace LoOP
