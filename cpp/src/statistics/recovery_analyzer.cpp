#include "effluent/statistics/recovery_analyzer.hpp"
#include "effluent/core/logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace effluent {

namespace {

void check_time_step(double time_step_days) {
    if (!(time_step_days > 0.0)) {
        throw std::invalid_argument("Time step must be > 0 days, got " +
                                    std::to_string(time_step_days));
    }
}

} // namespace

// ===== Run scan =====

std::vector<RecoveryEpisode> scan_episodes(std::span<const FailType> fail_types,
                                           double time_step_days) {
    check_time_step(time_step_days);

    std::vector<RecoveryEpisode> episodes;
    bool in_run = false;
    size_t run_start = 0;
    size_t run_length = 0;

    for (size_t i = 0; i < fail_types.size(); ++i) {
        const bool non_compliant = is_non_compliant(fail_types[i]);

        if (non_compliant) {
            if (!in_run) {
                // C -> N: start the accumulator
                in_run = true;
                run_start = i;
                run_length = 1;
            } else {
                // N -> N
                ++run_length;
            }
        } else if (in_run) {
            // N -> C: recovered
            episodes.push_back({run_start, run_length,
                                static_cast<double>(run_length) * time_step_days, true});
            in_run = false;
            run_length = 0;
        }
    }

    if (in_run) {
        episodes.push_back({run_start, run_length,
                            static_cast<double>(run_length) * time_step_days, false});
    }

    return episodes;
}

std::vector<double> compute_recovery_times(std::span<const FailType> fail_types,
                                           double time_step_days,
                                           OpenRunPolicy policy) {
    std::vector<double> samples;
    for (const auto& episode : scan_episodes(fail_types, time_step_days)) {
        if (episode.closed || policy == OpenRunPolicy::COUNT_AS_ONGOING) {
            samples.push_back(episode.duration_days);
        }
    }
    return samples;
}

std::vector<FailType> parse_fail_types(std::span<const std::string> labels) {
    std::vector<FailType> types;
    types.reserve(labels.size());
    for (const auto& label : labels) {
        types.push_back(fail_type_from_string(label));
    }
    return types;
}

std::vector<double> compute_recovery_times(const DataFrame& df,
                                           double time_step_days,
                                           OpenRunPolicy policy) {
    const std::vector<FailType> types = parse_fail_types(df.get_string(columns::FAIL_TYPE));
    return compute_recovery_times(types, time_step_days, policy);
}

// ===== Conversion and summary =====

double to_minutes(double days, double minutes_per_day) {
    return days * minutes_per_day;
}

std::vector<double> to_minutes(std::span<const double> days, double minutes_per_day) {
    std::vector<double> out;
    out.reserve(days.size());
    for (double d : days) {
        out.push_back(to_minutes(d, minutes_per_day));
    }
    return out;
}

std::optional<double> mean_recovery_time(std::span<const double> samples) {
    if (samples.empty()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (double s : samples) {
        sum += s;
    }
    return sum / static_cast<double>(samples.size());
}

RecoverySummary summarize_recovery(std::span<const double> samples_days, size_t bins,
                                   double minutes_per_day) {
    if (bins == 0) {
        throw std::invalid_argument("Number of bins must be > 0");
    }

    RecoverySummary summary;
    summary.samples_days.assign(samples_days.begin(), samples_days.end());
    summary.samples_minutes = to_minutes(samples_days, minutes_per_day);
    summary.count = summary.samples_minutes.size();
    summary.histogram = StatisticsEngine::histogram(summary.samples_minutes, bins);

    if (summary.count == 0) {
        return summary;
    }

    const auto& minutes = summary.samples_minutes;
    const double mean = *mean_recovery_time(minutes);

    double sq = 0.0;
    for (double m : minutes) {
        sq += (m - mean) * (m - mean);
    }

    summary.mean_minutes = mean;
    summary.std_minutes = std::sqrt(sq / static_cast<double>(summary.count));
    summary.min_minutes = *std::min_element(minutes.begin(), minutes.end());
    summary.max_minutes = *std::max_element(minutes.begin(), minutes.end());
    return summary;
}

RecoverySummary summarize_recovery(const DataFrame& df, const SimulationConfig& simulation,
                                   OpenRunPolicy policy, size_t bins) {
    simulation.validate();
    const std::vector<double> samples =
        compute_recovery_times(df, simulation.time_step_days, policy);

    log_debug("[RECOVERY] " + std::to_string(samples.size()) + " recovery episodes");
    return summarize_recovery(samples, bins, simulation.minutes_per_day());
}

} // namespace effluent
