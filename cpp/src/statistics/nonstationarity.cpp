#include "effluent/statistics/nonstationarity.hpp"
#include "effluent/core/config.hpp"
#include "effluent/core/logging.hpp"
#include "effluent/statistics/statistics_engine.hpp"
#include <cmath>
#include <stdexcept>

namespace effluent {

std::optional<double> non_stationarity_score(std::span<const double> values, size_t window) {
    if (window < 2) {
        throw std::invalid_argument("Non-stationarity window must be >= 2, got " +
                                    std::to_string(window));
    }

    std::vector<double> clean;
    clean.reserve(values.size());
    for (double v : values) {
        if (!std::isnan(v)) {
            clean.push_back(v);
        }
    }

    if (clean.size() < window) {
        return std::nullopt;
    }

    const double overall = StatisticsEngine::sample_variance(clean);
    if (overall == 0.0) {
        return std::nullopt;
    }

    const std::vector<double> rolling = StatisticsEngine::rolling_variance(clean, window);

    // The cleaned series has no NaN, so every position from window-1 on is defined
    double total = 0.0;
    size_t count = 0;
    for (size_t i = window - 1; i < rolling.size(); ++i) {
        total += std::fabs(rolling[i] - overall);
        ++count;
    }
    return (total / static_cast<double>(count)) / overall;
}

NonStationarityRow compute_nonstationarity_row(const std::string& scenario,
                                               const DataFrame& df,
                                               const std::vector<std::string>& columns,
                                               size_t window) {
    NonStationarityRow row;
    row.scenario = scenario;
    row.scores.reserve(columns.size());

    for (const auto& name : columns) {
        if (!df.has_column(name) || df.column_type(name) != ColumnType::FLOAT64) {
            log_warn("[NONSTAT] " + scenario + ": column '" + name + "' unavailable");
            row.scores.push_back(std::nullopt);
            continue;
        }
        row.scores.push_back(non_stationarity_score(df.get_f64(name), window));
    }
    return row;
}

NonStationarityTable compute_nonstationarity_table(
    const std::vector<std::pair<std::string, const DataFrame*>>& scenarios,
    const std::vector<std::string>& columns,
    size_t window)
{
    NonStationarityTable table;
    table.columns = columns.empty() ? default_nonstationarity_columns() : columns;
    table.rows.reserve(scenarios.size());

    for (const auto& [name, df] : scenarios) {
        if (!df) {
            throw std::invalid_argument("Null DataFrame for scenario: " + name);
        }
        table.rows.push_back(compute_nonstationarity_row(name, *df, table.columns, window));
    }
    return table;
}

} // namespace effluent
