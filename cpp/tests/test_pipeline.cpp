#include "test_common.hpp"

#include "effluent/core/config.hpp"
#include "effluent/core/errors.hpp"
#include "effluent/data/validators.hpp"
#include "effluent/processing/compliance_pipeline.hpp"

#include <limits>

using namespace effluent;
using namespace effluent::test;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

void runValidatorTests() {
    DataFrame ok = make_frame({COMPLIANT});
    validate_dataframe(ok, required_columns());

    DataFrame missing;
    missing.add_f64(columns::BOD_INFLUENT, {1.0});
    missing.add_f64(columns::COD_INFLUENT, {1.0});
    bool thrown = false;
    try {
        validate_dataframe(missing, required_columns());
    } catch (const DataValidationError& e) {
        thrown = true;
        REQUIRE(e.columns().size() == 4, "four missing columns");
        REQUIRE(contains(e.what(), "bod31") && contains(e.what(), "snh31"),
                "message names the missing columns");
    }
    REQUIRE(thrown, "missing columns rejected");

    DataFrame text;
    text.add_string(columns::BOD_INFLUENT, {"high"});
    text.add_f64(columns::COD_INFLUENT, {1.0});
    text.add_f64(columns::BOD_EFFLUENT, {1.0});
    text.add_f64(columns::COD_EFFLUENT, {1.0});
    text.add_f64(columns::SNH_INFLUENT, {1.0});
    text.add_f64(columns::SNH_EFFLUENT, {1.0});
    thrown = false;
    try {
        validate_dataframe(text, required_columns());
    } catch (const DataValidationError& e) {
        thrown = true;
        REQUIRE(e.columns().size() == 1 && e.columns()[0] == "bod1", "non-numeric bod1");
    }
    REQUIRE(thrown, "non-numeric column rejected");

    DataFrame empty = make_frame({});
    validate_dataframe(empty, required_columns());
    REQUIRE_THROWS(validate_dataframe(empty, required_columns(), false), DataValidationError,
                   "empty frame rejected when not allowed");

    REQUIRE_THROWS(process_dataframe(missing, ComplianceLimits{}), DataValidationError,
                   "pipeline validates before computing");
}

void runDataQualityTests() {
    DataFrame df = make_frame({COMPLIANT, {NaN, 10.0, 500.0, NaN}});
    const DataQualityReport report = data_quality_report(df);
    REQUIRE(report.total_rows == 2 && report.total_columns == 6, "shape");
    REQUIRE(report.missing_columns.empty(), "nothing missing");
    REQUIRE(report.has_expected_columns, "expected columns present");
    REQUIRE(report.null_counts.at("bod1") == 1 && report.null_counts.at("cod31") == 1,
            "NaN counts");
    REQUIRE(report.null_counts.at("cod1") == 0, "no NaN in cod1");
    REQUIRE(report.numeric_columns.size() == 6, "all numeric");
}

void runScenarioTests() {
    AnalysisConfig config;
    config.recovery_histogram_bins = 5;

    // C, fail, fail, C -> one recovery of 2 x 0.08 days
    DataFrame df = make_frame({COMPLIANT, BOD_MAX, BOD_LUT, COMPLIANT});
    const ScenarioResult result = process_scenario("baseline", df, config);

    REQUIRE(result.name == "baseline", "name");
    REQUIRE(result.data.row_count() == 4, "enriched rows");
    REQUIRE(result.data.has_column(columns::FAIL_TYPE), "classified");
    REQUIRE(result.data.has_column(columns::LIN_COD_E), "linearised");

    const ComplianceSummary& c = result.compliance;
    REQUIRE(c.total_rows == 4 && c.compliant == 2, "compliant count");
    REQUIRE(c.lut_exceedance == 1 && c.max_limit_failure == 1, "failure counts");
    REQUIRE(c.source_bod == 2 && c.source_cod == 0 && c.source_both == 0, "sources");
    REQUIRE(c.pass_source == 2, "rows without a failure source");
    REQUIRE(c.non_compliant() == 2, "non-compliant");
    REQUIRE(c.compliant_fraction.has_value(), "fraction defined");
    REQUIRE_NEAR(*c.compliant_fraction, 0.5, 1e-12, "pass rate");

    REQUIRE(result.recovery.count == 1, "one recovery");
    REQUIRE_NEAR(result.recovery.samples_days[0], 0.16, 1e-12, "recovery days");
    REQUIRE_NEAR(*result.recovery.mean_minutes, 230.4, 1e-9, "recovery minutes");
    REQUIRE(result.recovery.histogram.counts.size() == 5, "configured bins");

    // Four rows < window 30
    REQUIRE(result.nonstationarity_columns.size() == columns::LINEARISED.size(), "LIN columns");
    for (const auto& score : result.nonstationarity.scores) {
        REQUIRE(!score.has_value(), "series shorter than the window");
    }

    REQUIRE(result.statistics.size() == 4, "default statistics columns");
    REQUIRE(result.exceedance.size() == 4, "default exceedance thresholds");
    REQUIRE_NEAR(result.exceedance.at("bod31"), 0.25, 1e-12, "one bod31 above 50");

    // Input table is not modified
    REQUIRE(!df.has_column(columns::FAIL_TYPE), "input unchanged");
}

void runAllCompliantTests() {
    std::vector<Row> rows;
    for (int i = 0; i < 48; ++i) {
        rows.push_back({200.0 + i, 10.0 + 0.1 * i, 500.0 + 2.0 * i, 50.0 + 0.5 * (i % 7)});
    }

    const ScenarioResult result = process_scenario("baseline", make_frame(rows), AnalysisConfig{});
    REQUIRE(result.compliance.compliant == rows.size(), "every row compliant");
    REQUIRE(result.compliance.pass_source == rows.size(), "no failure sources");
    REQUIRE_NEAR(*result.compliance.compliant_fraction, 1.0, 1e-12, "100% compliant");
    REQUIRE(result.recovery.count == 0, "no recovery samples");
    REQUIRE(!mean_recovery_time(result.recovery.samples_days).has_value(),
            "mean recovery time is no data");

    // 48 rows >= window 30, every LIN column varies
    for (const auto& score : result.nonstationarity.scores) {
        REQUIRE(score.has_value() && *score >= 0.0, "defined non-negative score");
    }
}

void runEmptyScenarioTests() {
    const ScenarioResult result = process_scenario("empty", make_frame({}), AnalysisConfig{});
    REQUIRE(result.data.row_count() == 0, "no rows");
    REQUIRE(result.compliance.total_rows == 0, "no rows counted");
    REQUIRE(!result.compliance.compliant_fraction.has_value(), "fraction undefined");
    REQUIRE(result.recovery.count == 0 && !result.recovery.mean_minutes, "no recovery");
    for (const auto& score : result.nonstationarity.scores) {
        REQUIRE(!score.has_value(), "scores undefined");
    }
    for (const auto& named : result.statistics) {
        REQUIRE(named.stats.valid_count == 0 && std::isnan(named.stats.mean), "empty stats");
        REQUIRE(!named.cv.has_value(), "cv undefined");
    }
}

void runScenarioErrorTests() {
    DataFrame missing;
    missing.add_f64(columns::BOD_INFLUENT, {1.0});

    bool thrown = false;
    try {
        process_scenario("150%", missing, AnalysisConfig{});
    } catch (const ScenarioError& e) {
        thrown = true;
        REQUIRE(e.scenario() == "150%", "scenario name carried");
        REQUIRE(contains(e.what(), "150%") && contains(e.what(), "cod1"),
                "message names scenario and column");
    }
    REQUIRE(thrown, "ScenarioError raised");

    AnalysisConfig bad;
    bad.simulation.time_step_days = 0.0;
    REQUIRE_THROWS(process_scenario("x", make_frame({COMPLIANT}), bad), ConfigError,
                   "config validated up front");

    AnalysisConfig bad_limits;
    bad_limits.limits.bod_lower = 60.0;
    REQUIRE_THROWS(bad_limits.validate(), ConfigError, "lower above upper rejected");
}

void runMultiScenarioTests() {
    DataFrame broken;
    broken.add_f64(columns::BOD_INFLUENT, {1.0, 2.0});

    std::vector<ScenarioInput> inputs;
    inputs.push_back({"baseline", make_frame({COMPLIANT, BOD_MAX, COMPLIANT})});
    inputs.push_back({"130%", std::move(broken)});
    inputs.push_back({"150%", make_frame({COD_LUT, COD_LUT, COMPLIANT})});
    inputs.push_back({"190%", make_frame({})});

    const auto outcomes = analyze_scenarios(inputs, AnalysisConfig{});
    REQUIRE(outcomes.size() == 4, "one outcome per scenario");
    REQUIRE(outcomes[0].name == "baseline" && outcomes[3].name == "190%", "input order");

    REQUIRE(outcomes[0].ok() && outcomes[0].error.empty(), "baseline succeeded");
    REQUIRE(outcomes[0].result->compliance.max_limit_failure == 1, "baseline counts");

    REQUIRE(!outcomes[1].ok(), "broken scenario failed");
    REQUIRE(contains(outcomes[1].error, "130%"), "error names the scenario");

    REQUIRE(outcomes[2].ok(), "failure did not affect later scenarios");
    REQUIRE(outcomes[2].result->compliance.lut_exceedance == 2, "150% counts");
    REQUIRE(outcomes[2].result->compliance.source_cod == 2, "150% sources");
    REQUIRE(outcomes[2].result->recovery.count == 1, "150% recovery");

    REQUIRE(outcomes[3].ok() && outcomes[3].result->compliance.total_rows == 0, "empty ok");

    const NonStationarityTable table = collect_nonstationarity(outcomes);
    REQUIRE(table.rows.size() == 3, "failed scenario left out");
    REQUIRE(table.columns.size() == columns::LINEARISED.size(), "columns carried");
}

void runRegistryTests() {
    REQUIRE(default_scenarios().size() == 4, "four registered scenarios");
    const ScenarioSpec* shift = find_scenario("130%");
    REQUIRE(shift != nullptr && shift->folder == "1.3", "130% folder");
    REQUIRE(shift->label == "Shift 130%", "130% label");
    REQUIRE(find_scenario("nope") == nullptr, "unknown key");

    REQUIRE(fail_type_from_string("LUT Exceedance") == FailType::LUT_EXCEEDANCE, "parse label");
    REQUIRE(std::string(fail_type_to_string(FailType::MAX_LIMIT_FAILURE)) ==
                "Max Limit Failure", "format label");
    REQUIRE_THROWS(fail_type_from_string("Broken"), std::invalid_argument, "unknown label");
}

} // namespace

int main() {
    runValidatorTests();
    runDataQualityTests();
    runScenarioTests();
    runAllCompliantTests();
    runEmptyScenarioTests();
    runScenarioErrorTests();
    runMultiScenarioTests();
    runRegistryTests();
    std::cout << "[PASS] test_pipeline\n";
    return 0;
}
