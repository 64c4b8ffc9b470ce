#pragma once

#include "effluent/data/dataframe.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace effluent {

/// Statistical results for a data column (NaN values skipped)
struct ColumnStatistics {
    double mean;        ///< Arithmetic mean
    double std_dev;     ///< Sample standard deviation (ddof = 1)
    double variance;    ///< Sample variance (ddof = 1)
    double min;         ///< Minimum value
    double max;         ///< Maximum value
    double median;      ///< Median value
    double sum;         ///< Sum of all values
    size_t count;       ///< Number of values
    size_t valid_count; ///< Number of non-NaN values

    /// Fields other than the counts are NaN until computed
    ColumnStatistics();
};

/// Rolling window statistics; the first (window - 1) entries are NaN
struct RollingStatistics {
    size_t window = 0;
    std::vector<double> mean;
    std::vector<double> std_dev;
    std::vector<double> variance;
    std::vector<double> median;
};

/// Equal-width histogram
struct Histogram {
    double min = 0.0;          ///< Lower edge of the first bin
    double bin_width = 0.0;    ///< 0 when all values are equal
    std::vector<size_t> counts;
};

/// Named column statistics for tabular reports
struct NamedStatistics {
    std::string column;
    ColumnStatistics stats;
    std::optional<double> cv;  ///< Coefficient of variation, undefined for zero mean
};

/// Statistics over in-memory columns
class StatisticsEngine {
public:
    StatisticsEngine() = delete;  // Static class, no instances

    /// Basic statistics for a column of values
    static ColumnStatistics calculate(std::span<const double> values);

    /// Basic statistics for a named Float64 column
    static ColumnStatistics calculate(const DataFrame& df, const std::string& column_name);

    /// Rolling mean/std/variance/median (pandas semantics: a window containing
    /// NaN, or not yet full, yields NaN)
    /// @throws std::invalid_argument if window_size == 0
    static RollingStatistics calculate_rolling(std::span<const double> values, size_t window_size);

    /// Rolling sample variance only (used by the non-stationarity scorer)
    static std::vector<double> rolling_variance(std::span<const double> values, size_t window_size);

    /// Sample variance (ddof = 1) of NaN-free values; NaN when fewer than 2 values
    static double sample_variance(std::span<const double> values);

    /// Percentile by nearest-lower rank over non-NaN values; NaN for no data
    /// @throws std::invalid_argument unless 0 <= percentile_value <= 100
    static double percentile(std::span<const double> values, double percentile_value);

    /// Equal-width histogram over non-NaN values
    /// @throws std::invalid_argument if num_bins == 0
    static Histogram histogram(std::span<const double> values, size_t num_bins);

    /// std / mean; undefined when the mean is 0 or fewer than 2 valid values
    static std::optional<double> coefficient_of_variation(std::span<const double> values);

    /// Share of rows strictly above threshold (0.0 for an empty column)
    static double exceedance_probability(std::span<const double> values, double threshold);

    // ========== LOW-LEVEL STATISTICS ==========

    /// Mean over non-NaN values; NaN if none
    static double calculate_mean(const double* data, size_t length);

    /// Min/max over non-NaN values; both NaN if none
    static void calculate_min_max(const double* data, size_t length, double& min, double& max);
};

/// Statistics for several columns of one table (absent columns are skipped)
std::vector<NamedStatistics> summarize_columns(
    const DataFrame& df,
    const std::vector<std::string>& column_names
);

/// Exceedance probability per column for the given thresholds
/// (absent columns are skipped)
std::map<std::string, double> compute_exceedance(
    const DataFrame& df,
    const std::map<std::string, double>& thresholds
);

} // namespace effluent
