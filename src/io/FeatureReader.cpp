#include "io/FeatureReader.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace LoOP {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

std::string location(const std::string& source_name, int line_num) {
    return source_name + ":" + std::to_string(line_num);
}

}  // namespace

bool FeatureReader::is_missing_token(const std::string& token) {
    return token.empty() || token == "NA" || token == "NaN" || token == "nan" || token == "null";
}

std::vector<std::string> FeatureReader::split_line(const std::string& line) const {
    std::vector<std::string> cells;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(options_.delimiter, start);
        if (pos == std::string::npos) {
            cells.push_back(trim(line.substr(start)));
            break;
        }
        cells.push_back(trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return cells;
}

int FeatureReader::resolve_label_column(const std::vector<std::string>& header, int num_columns,
                                        const std::string& source_name) const {
    const std::string& wanted = options_.label_column;
    if (wanted.empty()) {
        return -1;
    }

    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == wanted) {
            return static_cast<int>(i);
        }
    }

    if (wanted.find_first_not_of("0123456789") == std::string::npos) {
        int index = std::stoi(wanted);
        if (index < num_columns) {
            return index;
        }
    }

    throw std::runtime_error("Label column '" + wanted + "' not found in " + source_name);
}

FeatureTable FeatureReader::read(const std::string& path) const {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open input file: " + path);
    }
    return read(ifs, path);
}

FeatureTable FeatureReader::read(std::istream& in, const std::string& source_name) const {
    FeatureTable table;

    std::string line;
    int line_num = 0;
    std::vector<std::string> header;

    // Find the first non-blank line; it fixes the column count
    std::vector<std::string> first_cells;
    while (std::getline(in, line)) {
        line_num++;
        if (!is_blank(line)) {
            first_cells = split_line(line);
            break;
        }
    }
    if (first_cells.empty()) {
        throw std::runtime_error("No data rows in " + source_name);
    }
    const int num_columns = static_cast<int>(first_cells.size());

    std::vector<std::vector<std::string>> rows;
    std::vector<int> row_lines;
    if (options_.has_header) {
        header = first_cells;
    } else {
        rows.push_back(first_cells);
        row_lines.push_back(line_num);
    }

    while (std::getline(in, line)) {
        line_num++;
        if (is_blank(line)) {
            continue;
        }
        std::vector<std::string> cells = split_line(line);
        if (static_cast<int>(cells.size()) != num_columns) {
            throw std::runtime_error("Expected " + std::to_string(num_columns) + " cells but found " +
                                     std::to_string(cells.size()) + " at " + location(source_name, line_num));
        }
        rows.push_back(std::move(cells));
        row_lines.push_back(line_num);
    }

    if (rows.empty()) {
        throw std::runtime_error("No data rows in " + source_name);
    }

    const int label_col = resolve_label_column(header, num_columns, source_name);

    for (int c = 0; c < num_columns; ++c) {
        if (c == label_col) {
            table.label_name = header.empty() ? "column_" + std::to_string(c) : header[c];
            continue;
        }
        table.feature_names.push_back(header.empty() ? "f" + std::to_string(table.feature_names.size()) : header[c]);
    }

    const int n = static_cast<int>(rows.size());
    const int d = static_cast<int>(table.feature_names.size());
    table.values.resize(n, d);

    std::vector<std::string> label_text;
    if (label_col >= 0) {
        label_text.reserve(static_cast<size_t>(n));
    }

    for (int r = 0; r < n; ++r) {
        int f = 0;
        for (int c = 0; c < num_columns; ++c) {
            const std::string& cell = rows[r][c];
            if (c == label_col) {
                label_text.push_back(cell);
                continue;
            }

            double value = std::numeric_limits<double>::quiet_NaN();
            if (!is_missing_token(cell)) {
                char* end = nullptr;
                errno = 0;
                value = std::strtod(cell.c_str(), &end);
                if (end == cell.c_str() || *end != '\0' || errno == ERANGE) {
                    throw std::runtime_error("Non-numeric value '" + cell + "' in column " + std::to_string(c) +
                                             " at " + location(source_name, row_lines[r]));
                }
            }
            table.values(r, f++) = value;
        }
    }

    if (label_col >= 0) {
        table.labels = table.cluster_index.encode(label_text);
    }

    LOG_DEBUG("Read " + std::to_string(n) + " observations x " + std::to_string(d) + " features from " +
              source_name);

    return table;
}

}  // namespace LoOP
