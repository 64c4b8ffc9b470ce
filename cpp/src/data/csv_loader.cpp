#include "effluent/data/csv_loader.hpp"
#include "effluent/core/logging.hpp"
#include "effluent/data/column.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace effluent {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

// ===== Public API =====

DataFrame CsvLoader::load(const std::string& path, const CsvOptions& opts) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + path);
    }

    DataFrame df = parse(buffer.str(), opts);
    log_debug("[CSV] Loaded " + path + " (" + std::to_string(df.row_count()) +
              " rows, " + std::to_string(df.column_count()) + " columns)");
    return df;
}

DataFrame CsvLoader::parse(const std::string& content, const CsvOptions& opts) {
    DataFrame df;
    std::istringstream stream(content);
    std::string line;

    // Skip rows
    for (int i = 0; i < opts.skip_rows; ++i) {
        if (!std::getline(stream, line)) {
            throw std::runtime_error("Not enough rows to skip");
        }
    }

    // Read header
    std::vector<std::string> column_names;
    if (opts.has_header) {
        if (!std::getline(stream, line)) {
            throw std::runtime_error("Empty file or missing header");
        }
        column_names = split_line(line, opts.delimiter);
        for (auto& name : column_names) {
            name = trim(name);
        }
    }

    // Read data rows
    std::vector<std::vector<std::string>> rows;
    size_t skipped = 0;
    while (std::getline(stream, line)) {
        // Skip empty lines
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        auto fields = split_line(line, opts.delimiter);

        const size_t expected = opts.has_header ? column_names.size()
                                                : (rows.empty() ? fields.size() : rows[0].size());
        if (fields.size() != expected) {
            ++skipped;
            continue;
        }

        rows.push_back(std::move(fields));
    }

    if (skipped > 0) {
        log_warn("[CSV] Skipped " + std::to_string(skipped) + " malformed rows");
    }

    // Header-only files are valid: a scenario with no rows
    const size_t num_cols = opts.has_header ? column_names.size()
                                            : (rows.empty() ? 0 : rows[0].size());
    const size_t num_rows = rows.size();

    if (!opts.has_header) {
        if (rows.empty()) {
            throw std::runtime_error("No data rows found");
        }
        column_names.clear();
        for (size_t i = 0; i < num_cols; ++i) {
            column_names.push_back("column_" + std::to_string(i));
        }
    }

    // Detect column types
    std::vector<ColumnType> types;
    if (opts.auto_detect_types) {
        const size_t sample_size = std::min(
            static_cast<size_t>(std::max(opts.infer_schema_rows, 1)),
            num_rows
        );
        types = detect_types(rows, sample_size);
        types.resize(num_cols, ColumnType::FLOAT64);
    } else {
        types = std::vector<ColumnType>(num_cols, ColumnType::FLOAT64);
    }

    // Create columns
    for (size_t col_idx = 0; col_idx < num_cols; ++col_idx) {
        const auto& col_name = column_names[col_idx];

        if (types[col_idx] == ColumnType::FLOAT64) {
            std::vector<double> values;
            values.reserve(num_rows);
            for (const auto& row : rows) {
                double value;
                if (try_parse_double(row[col_idx], value)) {
                    values.push_back(value);
                } else {
                    // Missing or unparsable cell
                    values.push_back(std::nan(""));
                }
            }
            df.add_f64(col_name, std::move(values));
        } else {
            std::vector<std::string> values;
            values.reserve(num_rows);
            for (const auto& row : rows) {
                values.push_back(trim(row[col_idx]));
            }
            df.add_string(col_name, std::move(values));
        }
    }

    return df;
}

// ===== Internal Methods =====

std::vector<ColumnType> CsvLoader::detect_types(
    const std::vector<std::vector<std::string>>& rows,
    size_t sample_size
) {
    if (rows.empty()) {
        return {};
    }

    const size_t num_cols = rows[0].size();
    std::vector<ColumnType> types(num_cols, ColumnType::FLOAT64);

    for (size_t col_idx = 0; col_idx < num_cols; ++col_idx) {
        for (size_t row_idx = 0; row_idx < sample_size; ++row_idx) {
            const std::string value = trim(rows[row_idx][col_idx]);
            if (value.empty()) {
                continue;
            }
            double parsed;
            if (!try_parse_double(value, parsed)) {
                types[col_idx] = ColumnType::STRING;
                break;
            }
        }
    }

    return types;
}

bool CsvLoader::try_parse_double(const std::string& str, double& out) {
    const std::string value = trim(str);
    if (value.empty()) {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    out = std::strtod(value.c_str(), &end);
    if (errno == ERANGE) {
        return false;
    }
    // Check if entire string was consumed
    return end == value.c_str() + value.size();
}

std::vector<std::string> CsvLoader::split_line(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == delimiter && !in_quotes) {
            fields.push_back(field);
            field.clear();
        } else if (c == '\r' || c == '\n') {
            break;
        } else {
            field += c;
        }
    }

    // Add last field
    fields.push_back(field);

    return fields;
}

} // namespace effluent
