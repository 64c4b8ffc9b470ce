#pragma once

/**
 * @file compliance_pipeline.hpp
 * @brief End-to-end compliance analysis of one or more scenarios
 *
 * Stage order within a scenario:
 *   validate -> thresholds -> linearisation -> deviations -> reductions
 *   -> PSI -> classification
 * followed by the scenario-level scorers (non-stationarity, recovery,
 * column statistics). Scenarios are independent and may run in parallel.
 */

#include "effluent/core/config.hpp"
#include "effluent/data/dataframe.hpp"
#include "effluent/data/validators.hpp"
#include "effluent/statistics/compliance_summary.hpp"
#include "effluent/statistics/nonstationarity.hpp"
#include "effluent/statistics/recovery_analyzer.hpp"
#include "effluent/statistics/statistics_engine.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace effluent {

/// Validate the raw table and derive every per-row column
/// @throws DataValidationError for missing or non-numeric required columns
DataFrame process_dataframe(const DataFrame& df, const ComplianceLimits& limits);

/// Everything computed for one scenario
struct ScenarioResult {
    std::string name;
    DataFrame data;                              ///< Enriched table
    ComplianceSummary compliance;
    NonStationarityRow nonstationarity;
    std::vector<std::string> nonstationarity_columns;
    RecoverySummary recovery;
    std::vector<NamedStatistics> statistics;
    std::map<std::string, double> exceedance;
    DataQualityReport quality;
};

/// Analyse one scenario
/// @throws ConfigError for an invalid configuration
/// @throws ScenarioError wrapping any failure while processing the data
ScenarioResult process_scenario(const std::string& name, const DataFrame& df,
                                const AnalysisConfig& config);

/// Named raw input table
struct ScenarioInput {
    std::string name;
    DataFrame data;
};

/// Result or error of one scenario
struct ScenarioOutcome {
    std::string name;
    std::unique_ptr<ScenarioResult> result;   ///< Null on failure
    std::string error;                        ///< Empty on success

    bool ok() const { return result != nullptr; }
};

/// Analyse independent scenarios; outcomes are in input order and a failing
/// scenario does not affect the others.
/// @throws ConfigError for an invalid configuration (checked once, up front)
std::vector<ScenarioOutcome> analyze_scenarios(const std::vector<ScenarioInput>& inputs,
                                               const AnalysisConfig& config);

/// Non-stationarity table over the successful outcomes
NonStationarityTable collect_nonstationarity(const std::vector<ScenarioOutcome>& outcomes);

} // namespace effluent
