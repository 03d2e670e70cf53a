#pragma once

#include <CLI/CLI.hpp>
#include <algorithm>
#include <iostream>
#include <map>
#include <string>

#include "core/Config.hpp"

namespace LoOP {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"loop_score - Local Outlier Probabilities for tabular numeric data"};

        // Input/Output
        app.add_option("-i,--input", config.input_path, "Delimited feature file (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-o,--output-dir", config.output_dir, "Output Directory (Default: output)");

        app.add_option("-l,--label-column", config.label_column,
            "Cluster label column, by header name or 0-based index (Default: single cluster)");

        std::string delimiter_str = ",";
        app.add_option("-d,--delimiter", delimiter_str, "Field delimiter, a single character or 'tab' (Default: ,)");

        bool no_header = false;
        app.add_flag("--no-header", no_header, "Input has no header line");

        // LoOP Parameters
        app.add_option("-k,--n-neighbors", config.n_neighbors, "Number of neighbors per observation (Default: 10)")
            ->check(CLI::PositiveNumber);

        app.add_option("-e,--extent", config.extent, "Statistical extent in (0, 1] (Default: 0.997)")
            ->check(CLI::Range(0.0, 1.0));

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: 1)")
            ->check(CLI::PositiveNumber);

        // Output
        app.add_option("--precision", config.precision, "Decimal places for scores (Default: 6)")
            ->check(CLI::Range(1, 17));

        app.add_flag("--write-statistics", config.write_statistics,
            "Write statistics.tsv and clusters.tsv with every intermediate column");

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str,
            "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Append log records to this file");

        bool no_color = false;
        app.add_flag("--no-color", no_color, "Disable colored log output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // If help is requested (ret=0) or error occurs (ret>0), we print message and return false.
            app.exit(e);
            return false;
        }

        static const std::map<std::string, LogLevel> log_level_map = {
            {"error", LogLevel::LOG_ERROR},
            {"warn", LogLevel::LOG_WARN},
            {"info", LogLevel::LOG_INFO},
            {"debug", LogLevel::LOG_DEBUG}
        };

        std::string log_lower = log_level_str;
        std::transform(log_lower.begin(), log_lower.end(), log_lower.begin(), ::tolower);
        auto it = log_level_map.find(log_lower);
        if (it != log_level_map.end()) {
            config.log_level = it->second;
        }

        std::string delim_lower = delimiter_str;
        std::transform(delim_lower.begin(), delim_lower.end(), delim_lower.begin(), ::tolower);
        if (delim_lower == "tab" || delim_lower == "\\t") {
            config.delimiter = '\t';
        } else if (delimiter_str.size() == 1) {
            config.delimiter = delimiter_str[0];
        } else {
            std::cerr << "Error: --delimiter must be a single character or 'tab', got '" << delimiter_str << "'"
                      << std::endl;
            return false;
        }

        config.has_header = !no_header;
        config.use_color = !no_color;

        return true;
    }
};

}  // namespace Utils
}  // namespace LoOP
