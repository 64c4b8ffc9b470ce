#include "effluent/data/validators.hpp"
#include "effluent/core/errors.hpp"
#include "effluent/core/types.hpp"
#include <cmath>

namespace effluent {

namespace {

std::string join(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

} // namespace

std::vector<std::string> required_columns() {
    return {columns::REQUIRED.begin(), columns::REQUIRED.end()};
}

std::vector<std::string> check_required_columns(
    const DataFrame& df,
    const std::vector<std::string>& required
) {
    std::vector<std::string> missing;
    for (const auto& name : required) {
        if (!df.has_column(name)) {
            missing.push_back(name);
        }
    }
    return missing;
}

std::vector<std::string> non_numeric_columns(
    const DataFrame& df,
    const std::vector<std::string>& columns
) {
    std::vector<std::string> invalid;
    for (const auto& name : columns) {
        if (df.has_column(name) && df.column_type(name) != ColumnType::FLOAT64) {
            invalid.push_back(name);
        }
    }
    return invalid;
}

void validate_dataframe(
    const DataFrame& df,
    const std::vector<std::string>& required,
    bool allow_empty
) {
    auto missing = check_required_columns(df, required);
    if (!missing.empty()) {
        const std::string message = "Missing required columns: " + join(missing) +
                                    ". Found columns: " + join(df.column_names());
        throw DataValidationError(message, std::move(missing));
    }

    auto invalid = non_numeric_columns(df, required);
    if (!invalid.empty()) {
        const std::string message = "Non-numeric required columns: " + join(invalid);
        throw DataValidationError(message, std::move(invalid));
    }

    if (!allow_empty && df.row_count() == 0) {
        throw DataValidationError("DataFrame is empty");
    }
}

DataQualityReport data_quality_report(const DataFrame& df) {
    DataQualityReport report;
    report.total_rows = df.row_count();
    report.total_columns = df.column_count();
    report.missing_columns = check_required_columns(df, required_columns());

    for (const auto& name : df.column_names()) {
        if (df.column_type(name) != ColumnType::FLOAT64) {
            continue;
        }
        report.numeric_columns.push_back(name);

        size_t nulls = 0;
        for (double v : df.get_f64(name)) {
            if (std::isnan(v)) {
                ++nulls;
            }
        }
        report.null_counts[name] = nulls;
    }

    report.has_expected_columns =
        df.has_column(columns::BOD_INFLUENT) && df.has_column(columns::COD_INFLUENT) &&
        df.has_column(columns::BOD_EFFLUENT) && df.has_column(columns::COD_EFFLUENT);

    return report;
}

} // namespace effluent
