#pragma once

#include "effluent/data/dataframe.hpp"
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace effluent {

/// Default rolling window (rows)
inline constexpr size_t DEFAULT_NONSTATIONARITY_WINDOW = 30;

/// Mean absolute deviation of the rolling sample variance from the overall
/// sample variance, relative to the overall variance.
///
/// NaN entries are dropped before scoring. The first (window - 1) rolling
/// positions are excluded.
///
/// @return nullopt when fewer than `window` valid values remain or the
///         overall variance is exactly 0
/// @throws std::invalid_argument if window < 2
std::optional<double> non_stationarity_score(
    std::span<const double> values,
    size_t window = DEFAULT_NONSTATIONARITY_WINDOW
);

/// Scores of one scenario, aligned with NonStationarityTable::columns
struct NonStationarityRow {
    std::string scenario;
    std::vector<std::optional<double>> scores;
};

/// Scenario x column score table
struct NonStationarityTable {
    std::vector<std::string> columns;
    std::vector<NonStationarityRow> rows;
};

/// Score the given columns of one table (absent columns are undefined)
NonStationarityRow compute_nonstationarity_row(
    const std::string& scenario,
    const DataFrame& df,
    const std::vector<std::string>& columns,
    size_t window = DEFAULT_NONSTATIONARITY_WINDOW
);

/// One row per scenario, in input order. An empty column list means the
/// linearised columns.
NonStationarityTable compute_nonstationarity_table(
    const std::vector<std::pair<std::string, const DataFrame*>>& scenarios,
    const std::vector<std::string>& columns,
    size_t window = DEFAULT_NONSTATIONARITY_WINDOW
);

} // namespace effluent
