#pragma once

#include "effluent/data/dataframe.hpp"
#include <string>
#include <vector>

namespace effluent {

/// CSV Loader - boundary reader for scenario tables
///
/// Numeric columns become Float64 (unparsable cells -> NaN); columns with
/// any non-numeric sample become String so the validator can reject them.
class CsvLoader {
public:
    CsvLoader() = delete;  // Static class, no instances

    /// Load CSV file into DataFrame
    static DataFrame load(const std::string& path, const CsvOptions& opts);

    /// Parse CSV content already in memory
    static DataFrame parse(const std::string& content, const CsvOptions& opts);

private:
    /// Detect column types from sample data
    static std::vector<ColumnType> detect_types(
        const std::vector<std::vector<std::string>>& rows,
        size_t sample_size
    );

    /// Parse a double, requiring the whole (trimmed) field to be consumed
    static bool try_parse_double(const std::string& str, double& out);

    /// Split CSV line into fields
    static std::vector<std::string> split_line(
        const std::string& line,
        char delimiter
    );
};

} // namespace effluent
