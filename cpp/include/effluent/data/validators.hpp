#pragma once

#include "effluent/data/dataframe.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace effluent {

/// Required observation columns as strings
std::vector<std::string> required_columns();

/// Names from `required` that are absent from the table
std::vector<std::string> check_required_columns(
    const DataFrame& df,
    const std::vector<std::string>& required
);

/// Names from `columns` that exist but are not Float64
std::vector<std::string> non_numeric_columns(
    const DataFrame& df,
    const std::vector<std::string>& columns
);

/// Contract check run at the boundary before the numeric core
/// @throws DataValidationError listing missing or non-numeric columns,
///         or when the table is empty and allow_empty is false
void validate_dataframe(
    const DataFrame& df,
    const std::vector<std::string>& required,
    bool allow_empty = true
);

/// Data quality summary for a raw scenario table
struct DataQualityReport {
    size_t total_rows = 0;
    size_t total_columns = 0;
    std::vector<std::string> missing_columns;     ///< Required columns not present
    std::map<std::string, size_t> null_counts;    ///< NaN count per Float64 column
    std::vector<std::string> numeric_columns;     ///< Float64 columns, insertion order
    bool has_expected_columns = false;            ///< bod1, cod1, bod31, cod31 present
};

DataQualityReport data_quality_report(const DataFrame& df);

} // namespace effluent
