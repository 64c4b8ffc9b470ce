#pragma once

#include "effluent/core/config.hpp"
#include "effluent/core/types.hpp"
#include "effluent/data/dataframe.hpp"
#include "effluent/statistics/statistics_engine.hpp"
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace effluent {

/// One maximal run of non-compliant rows
struct RecoveryEpisode {
    size_t start_index;     ///< First non-compliant row
    size_t length;          ///< Number of consecutive non-compliant rows
    double duration_days;   ///< length x time_step
    bool closed;            ///< false for a run still open at the end of the series
};

/// All non-compliant runs in row order; a trailing run is reported with closed = false
std::vector<RecoveryEpisode> scan_episodes(std::span<const FailType> fail_types,
                                           double time_step_days);

/// Recovery durations in days, one per closed run (plus the open run when
/// the policy counts it)
/// @throws std::invalid_argument if time_step_days <= 0
std::vector<double> compute_recovery_times(
    std::span<const FailType> fail_types,
    double time_step_days,
    OpenRunPolicy policy = OpenRunPolicy::DROP
);

/// Same, reading the table's fail_type column
/// @throws std::invalid_argument for unknown fail_type labels
std::vector<double> compute_recovery_times(
    const DataFrame& df,
    double time_step_days,
    OpenRunPolicy policy = OpenRunPolicy::DROP
);

/// Parse a fail_type String column
std::vector<FailType> parse_fail_types(std::span<const std::string> labels);

/// Days to minutes (x 24 x 60 by default)
double to_minutes(double days, double minutes_per_day = 24.0 * 60.0);
std::vector<double> to_minutes(std::span<const double> days, double minutes_per_day = 24.0 * 60.0);

/// Mean of the samples; nullopt when there are none
std::optional<double> mean_recovery_time(std::span<const double> samples);

/// Recovery analysis of one scenario
struct RecoverySummary {
    size_t count = 0;
    std::optional<double> mean_minutes;
    std::optional<double> std_minutes;   ///< Population standard deviation
    std::optional<double> min_minutes;
    std::optional<double> max_minutes;
    std::vector<double> samples_days;
    std::vector<double> samples_minutes;
    Histogram histogram;                 ///< Of samples_minutes; all-zero counts when empty
};

/// Summary of the given recovery samples (days)
/// @throws std::invalid_argument if bins == 0
RecoverySummary summarize_recovery(std::span<const double> samples_days, size_t bins = 10,
                                   double minutes_per_day = 24.0 * 60.0);

/// Scan the table's fail_type column and summarise
RecoverySummary summarize_recovery(const DataFrame& df, const SimulationConfig& simulation,
                                   OpenRunPolicy policy = OpenRunPolicy::DROP,
                                   size_t bins = 10);

} // namespace effluent
