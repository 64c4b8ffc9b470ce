#include "effluent/statistics/statistics_engine.hpp"
#include "effluent/processing/arrow_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace effluent {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Non-NaN values of a span, in order
std::vector<double> valid_values(std::span<const double> values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        if (!std::isnan(v)) {
            out.push_back(v);
        }
    }
    return out;
}

/// Median of a copy (sorted in place)
double median_of(std::vector<double> values) {
    if (values.empty()) {
        return NaN;
    }
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return 0.5 * (values[mid - 1] + values[mid]);
}

bool contains_nan(std::span<const double> values) {
    return std::any_of(values.begin(), values.end(), [](double v) { return std::isnan(v); });
}

} // namespace

ColumnStatistics::ColumnStatistics()
    : mean(NaN), std_dev(NaN), variance(NaN), min(NaN), max(NaN)
    , median(NaN), sum(0.0), count(0), valid_count(0)
{}

// ===== Low-level =====

double StatisticsEngine::calculate_mean(const double* data, size_t length) {
    if (length == 0) {
        return NaN;
    }

#ifdef HAVE_ARROW
    // Arrow path only for NaN-free input (Arrow counts NaN as a value)
    const std::span<const double> view(data, length);
    if (length >= arrow_utils::ARROW_THRESHOLD && !contains_nan(view)) {
        double mean;
        if (arrow_utils::mean_arrow(view, mean)) {
            return mean;
        }
    }
#endif

    double sum = 0.0;
    size_t valid = 0;
    for (size_t i = 0; i < length; ++i) {
        if (!std::isnan(data[i])) {
            sum += data[i];
            ++valid;
        }
    }
    return valid == 0 ? NaN : sum / static_cast<double>(valid);
}

void StatisticsEngine::calculate_min_max(const double* data, size_t length,
                                         double& min, double& max) {
    min = max = NaN;
    if (length == 0) {
        return;
    }

#ifdef HAVE_ARROW
    if (length >= arrow_utils::ARROW_THRESHOLD &&
        arrow_utils::min_max_arrow(std::span<const double>(data, length), min, max)) {
        return;
    }
#endif

    // Scalar implementation
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    bool any = false;
    for (size_t i = 0; i < length; ++i) {
        const double v = data[i];
        if (std::isnan(v)) {
            continue;
        }
        any = true;
        if (v < lo) lo = v;
        if (v > hi) hi = v;
    }

    if (any) {
        min = lo;
        max = hi;
    }
}

double StatisticsEngine::sample_variance(std::span<const double> values) {
    const size_t n = values.size();
    if (n < 2) {
        return NaN;
    }
    double mean = 0.0;
    for (double v : values) {
        mean += v;
    }
    mean /= static_cast<double>(n);

    double sq = 0.0;
    for (double v : values) {
        const double d = v - mean;
        sq += d * d;
    }
    return sq / static_cast<double>(n - 1);
}

// ===== Column statistics =====

ColumnStatistics StatisticsEngine::calculate(std::span<const double> values) {
    ColumnStatistics stats;
    stats.count = values.size();

    std::vector<double> valid = valid_values(values);
    stats.valid_count = valid.size();
    if (valid.empty()) {
        return stats;  // All NaN: NaN fields, zero sum
    }

    for (double v : valid) {
        stats.sum += v;
    }
    stats.mean = calculate_mean(valid.data(), valid.size());
    calculate_min_max(valid.data(), valid.size(), stats.min, stats.max);
    stats.variance = sample_variance(valid);
    stats.std_dev = std::sqrt(stats.variance);
    stats.median = median_of(std::move(valid));
    return stats;
}

ColumnStatistics StatisticsEngine::calculate(const DataFrame& df, const std::string& column_name) {
    return calculate(df.get_f64(column_name));
}

RollingStatistics StatisticsEngine::calculate_rolling(std::span<const double> values,
                                                      size_t window_size) {
    if (window_size == 0) {
        throw std::invalid_argument("Window size must be > 0");
    }

    const size_t length = values.size();
    RollingStatistics rolling;
    rolling.window = window_size;
    rolling.mean.assign(length, NaN);
    rolling.std_dev.assign(length, NaN);
    rolling.variance.assign(length, NaN);
    rolling.median.assign(length, NaN);

    if (length < window_size) {
        return rolling;  // Not enough data
    }

    for (size_t end = window_size; end <= length; ++end) {
        const auto window = values.subspan(end - window_size, window_size);
        if (contains_nan(window)) {
            continue;
        }
        const size_t i = end - 1;
        rolling.mean[i] = calculate_mean(window.data(), window.size());
        rolling.variance[i] = sample_variance(window);
        rolling.std_dev[i] = std::sqrt(rolling.variance[i]);
        rolling.median[i] = median_of(std::vector<double>(window.begin(), window.end()));
    }

    return rolling;
}

std::vector<double> StatisticsEngine::rolling_variance(std::span<const double> values,
                                                       size_t window_size) {
    if (window_size == 0) {
        throw std::invalid_argument("Window size must be > 0");
    }

    std::vector<double> out(values.size(), NaN);
    if (values.size() < window_size) {
        return out;
    }
    for (size_t end = window_size; end <= values.size(); ++end) {
        const auto window = values.subspan(end - window_size, window_size);
        if (!contains_nan(window)) {
            out[end - 1] = sample_variance(window);
        }
    }
    return out;
}

double StatisticsEngine::percentile(std::span<const double> values, double percentile_value) {
    if (percentile_value < 0.0 || percentile_value > 100.0) {
        throw std::invalid_argument("Percentile must be between 0 and 100");
    }

    std::vector<double> valid = valid_values(values);
    if (valid.empty()) {
        return NaN;
    }

    std::sort(valid.begin(), valid.end());
    const size_t index = static_cast<size_t>((percentile_value / 100.0) *
                                             static_cast<double>(valid.size() - 1));
    return valid[index];
}

Histogram StatisticsEngine::histogram(std::span<const double> values, size_t num_bins) {
    if (num_bins == 0) {
        throw std::invalid_argument("Number of bins must be > 0");
    }

    Histogram hist;
    hist.counts.assign(num_bins, 0);

    double min_val, max_val;
    calculate_min_max(values.data(), values.size(), min_val, max_val);
    if (std::isnan(min_val)) {
        return hist;  // No valid values
    }

    hist.min = min_val;
    hist.bin_width = (max_val - min_val) / static_cast<double>(num_bins);

    for (double v : values) {
        if (std::isnan(v)) {
            continue;
        }
        if (hist.bin_width == 0.0) {
            // All values are the same
            hist.counts[0]++;
            continue;
        }
        size_t bin_index = static_cast<size_t>((v - min_val) / hist.bin_width);
        // Value == max lands in the last bin
        if (bin_index >= num_bins) {
            bin_index = num_bins - 1;
        }
        hist.counts[bin_index]++;
    }

    return hist;
}

std::optional<double> StatisticsEngine::coefficient_of_variation(std::span<const double> values) {
    const ColumnStatistics stats = calculate(values);
    if (stats.valid_count < 2 || stats.mean == 0.0) {
        return std::nullopt;
    }
    return stats.std_dev / stats.mean;
}

double StatisticsEngine::exceedance_probability(std::span<const double> values, double threshold) {
    if (values.empty()) {
        return 0.0;
    }
    const auto above = std::count_if(values.begin(), values.end(),
                                     [threshold](double v) { return v > threshold; });
    return static_cast<double>(above) / static_cast<double>(values.size());
}

// ===== Table helpers =====

std::vector<NamedStatistics> summarize_columns(
    const DataFrame& df,
    const std::vector<std::string>& column_names
) {
    std::vector<NamedStatistics> rows;
    for (const auto& name : column_names) {
        if (!df.has_column(name) || df.column_type(name) != ColumnType::FLOAT64) {
            continue;
        }
        const auto values = df.get_f64(name);
        rows.push_back({name, StatisticsEngine::calculate(values),
                        StatisticsEngine::coefficient_of_variation(values)});
    }
    return rows;
}

std::map<std::string, double> compute_exceedance(
    const DataFrame& df,
    const std::map<std::string, double>& thresholds
) {
    std::map<std::string, double> out;
    for (const auto& [name, threshold] : thresholds) {
        if (!df.has_column(name) || df.column_type(name) != ColumnType::FLOAT64) {
            continue;
        }
        out[name] = StatisticsEngine::exceedance_probability(df.get_f64(name), threshold);
    }
    return out;
}

} // namespace effluent
