#include "core/Config.hpp"

#include <filesystem>
#include <iostream>

namespace LoOP {

bool Config::validate() const {
    bool valid = true;

    if (input_path.empty()) {
        std::cerr << "Error: Input file path is required." << std::endl;
        valid = false;
    } else if (!std::filesystem::is_regular_file(input_path)) {
        std::cerr << "Error: Cannot open input file: " << input_path << std::endl;
        valid = false;
    }

    if (output_dir.empty()) {
        std::cerr << "Error: Output directory must not be empty." << std::endl;
        valid = false;
    }

    if (!(extent > 0.0 && extent <= 1.0)) {
        std::cerr << "Error: extent must be in (0, 1]." << std::endl;
        valid = false;
    }

    if (n_neighbors <= 0) {
        std::cerr << "Error: n_neighbors must be positive." << std::endl;
        valid = false;
    }

    if (threads <= 0) {
        std::cerr << "Error: threads must be positive." << std::endl;
        valid = false;
    }

    if (precision < 1 || precision > 17) {
        std::cerr << "Error: precision must be between 1 and 17." << std::endl;
        valid = false;
    }

    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        std::cerr << "Error: Unsupported delimiter." << std::endl;
        valid = false;
    }

    if (!has_header && !label_column.empty() &&
        label_column.find_first_not_of("0123456789") != std::string::npos) {
        std::cerr << "Error: label column must be an index when the input has no header." << std::endl;
        valid = false;
    }

    return valid;
}

void Config::print() const {
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "Input: " << input_path << std::endl;
    std::cout << "Delimiter: '" << (delimiter == '\t' ? std::string("\\t") : std::string(1, delimiter))
              << "', Header: " << (has_header ? "yes" : "no") << std::endl;
    std::cout << "Label Column: " << (label_column.empty() ? "None" : label_column) << std::endl;
    std::cout << "Output Dir: " << output_dir << std::endl;
    std::cout << "Extent: " << extent << std::endl;
    std::cout << "Neighbors: " << n_neighbors << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "Statistics Table: " << (write_statistics ? "enabled" : "disabled") << std::endl;
    std::cout << "---------------------" << std::endl;
}

LoopConfig Config::to_loop_config() const {
    LoopConfig loop_config;
    loop_config.extent = extent;
    loop_config.n_neighbors = n_neighbors;
    loop_config.num_threads = threads;
    return loop_config;
}

}  // namespace LoOP
