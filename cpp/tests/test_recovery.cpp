#include "test_common.hpp"

#include "effluent/core/config.hpp"
#include "effluent/statistics/recovery_analyzer.hpp"

#include <stdexcept>

using namespace effluent;
using namespace effluent::test;

namespace {

constexpr FailType C = FailType::COMPLIANT;
constexpr FailType L = FailType::LUT_EXCEEDANCE;
constexpr FailType M = FailType::MAX_LIMIT_FAILURE;

void runRecoveryTimeTests() {
    const std::vector<FailType> seq = {C, C, M, L, M, C, C, L, C};
    const auto times = compute_recovery_times(seq, 0.08);
    REQUIRE(times.size() == 2, "two closed runs");
    REQUIRE_NEAR(times[0], 0.24, 1e-12, "3 rows x 0.08 days");
    REQUIRE_NEAR(times[1], 0.08, 1e-12, "1 row x 0.08 days");

    const auto episodes = scan_episodes(seq, 0.08);
    REQUIRE(episodes.size() == 2, "two episodes");
    REQUIRE(episodes[0].start_index == 2 && episodes[0].length == 3, "first episode");
    REQUIRE(episodes[1].start_index == 7 && episodes[1].length == 1, "second episode");
    REQUIRE(episodes[0].closed && episodes[1].closed, "both closed");

    // Series starting non-compliant: the leading run counts once it recovers
    const std::vector<FailType> leading = {L, L, C};
    const auto lead_times = compute_recovery_times(leading, 0.5);
    REQUIRE(lead_times.size() == 1, "leading run recovered");
    REQUIRE_NEAR(lead_times[0], 1.0, 1e-12, "2 rows x 0.5 days");

    REQUIRE(compute_recovery_times(std::vector<FailType>{C, C, C}, 0.08).empty(),
            "compliant series has no recoveries");
    REQUIRE(compute_recovery_times(std::vector<FailType>{}, 0.08).empty(), "empty series");
}

void runOpenRunTests() {
    const std::vector<FailType> seq = {M, M, C, L, L};

    const auto dropped = compute_recovery_times(seq, 0.08, OpenRunPolicy::DROP);
    REQUIRE(dropped.size() == 1, "open run dropped");
    REQUIRE_NEAR(dropped[0], 0.16, 1e-12, "closed run only");

    const auto counted = compute_recovery_times(seq, 0.08, OpenRunPolicy::COUNT_AS_ONGOING);
    REQUIRE(counted.size() == 2, "open run counted");
    REQUIRE_NEAR(counted[1], 0.16, 1e-12, "open run observed length");

    const auto episodes = scan_episodes(seq, 0.08);
    REQUIRE(episodes.size() == 2, "scan reports the open run");
    REQUIRE(!episodes[1].closed, "trailing run is open");

    // Appending an open N,N run adds nothing under the default policy
    const std::vector<FailType> trailing = {C, C, L, L, L, C, C, M, C, L, M};
    const auto closed_only = compute_recovery_times(trailing, 0.08);
    REQUIRE(closed_only.size() == 2, "trailing run ignored");
    REQUIRE_NEAR(closed_only[0], 0.24, 1e-12, "first closed run");
    REQUIRE_NEAR(closed_only[1], 0.08, 1e-12, "second closed run");

    const std::vector<FailType> never = {L, M, L};
    REQUIRE(compute_recovery_times(never, 0.08).empty(), "never recovers: no sample");
    REQUIRE(compute_recovery_times(never, 0.08, OpenRunPolicy::COUNT_AS_ONGOING).size() == 1,
            "never recovers: one ongoing sample");
}

void runConversionTests() {
    REQUIRE_NEAR(to_minutes(0.24), 345.6, 1e-9, "days to minutes");
    REQUIRE_NEAR(to_minutes(1.0), 1440.0, 1e-12, "one day");

    REQUIRE(!mean_recovery_time(std::vector<double>{}).has_value(), "empty mean undefined");
    const auto mean = mean_recovery_time(std::vector<double>{0.24, 0.08});
    REQUIRE(mean.has_value(), "mean defined");
    REQUIRE_NEAR(*mean, 0.16, 1e-12, "mean of samples");

    REQUIRE_THROWS(compute_recovery_times(std::vector<FailType>{C, L, C}, 0.0),
                   std::invalid_argument, "zero time step rejected");
    REQUIRE_THROWS(compute_recovery_times(std::vector<FailType>{C, L, C}, -0.08),
                   std::invalid_argument, "negative time step rejected");
}

void runSummaryTests() {
    const std::vector<double> samples = {0.24, 0.08};
    const RecoverySummary summary = summarize_recovery(samples, 4);
    REQUIRE(summary.count == 2, "count");
    REQUIRE_NEAR(*summary.mean_minutes, 230.4, 1e-9, "mean minutes");
    REQUIRE_NEAR(*summary.std_minutes, 115.2, 1e-9, "population std minutes");
    REQUIRE_NEAR(*summary.min_minutes, 115.2, 1e-9, "min minutes");
    REQUIRE_NEAR(*summary.max_minutes, 345.6, 1e-9, "max minutes");
    REQUIRE(summary.histogram.counts.size() == 4, "bin count");
    REQUIRE(summary.histogram.counts.front() == 1 && summary.histogram.counts.back() == 1,
            "samples at both ends of the histogram");

    const RecoverySummary empty = summarize_recovery(std::vector<double>{});
    REQUIRE(empty.count == 0, "empty count");
    REQUIRE(!empty.mean_minutes && !empty.std_minutes, "empty mean/std undefined");
    REQUIRE(!empty.min_minutes && !empty.max_minutes, "empty min/max undefined");

    REQUIRE_THROWS(summarize_recovery(samples, 0), std::invalid_argument, "zero bins");
}

void runDataFrameTests() {
    DataFrame df;
    df.add_string(columns::FAIL_TYPE,
                  {"Compliant", "LUT Exceedance", "Max Limit Failure", "Compliant"});

    SimulationConfig sim;
    const auto times = compute_recovery_times(df, sim.time_step_days);
    REQUIRE(times.size() == 1, "one recovery from the table");
    REQUIRE_NEAR(times[0], 0.16, 1e-12, "2 rows x 0.08 days");

    const RecoverySummary summary = summarize_recovery(df, sim);
    REQUIRE(summary.count == 1, "summary count");
    REQUIRE_NEAR(*summary.mean_minutes, 230.4, 1e-9, "summary mean minutes");

    DataFrame bad;
    bad.add_string(columns::FAIL_TYPE, {"Compliant", "Exploded"});
    REQUIRE_THROWS(compute_recovery_times(bad, 0.08), std::invalid_argument,
                   "unknown label rejected");
}

} // namespace

int main() {
    runRecoveryTimeTests();
    runOpenRunTests();
    runConversionTests();
    runSummaryTests();
    runDataFrameTests();
    std::cout << "[PASS] test_recovery\n";
    return 0;
}
