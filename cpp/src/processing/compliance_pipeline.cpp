#include "effluent/processing/compliance_pipeline.hpp"
#include "effluent/core/errors.hpp"
#include "effluent/core/logging.hpp"
#include "effluent/processing/deviation.hpp"
#include "effluent/processing/failure_classifier.hpp"
#include "effluent/processing/linearisation.hpp"
#include "effluent/processing/psi_calculator.hpp"
#include "effluent/processing/threshold_calculator.hpp"
#include <exception>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace effluent {

// ===== Per-row stages =====

DataFrame process_dataframe(const DataFrame& df, const ComplianceLimits& limits) {
    validate_dataframe(df, required_columns());
    log_debug("[PIPELINE] Processing " + std::to_string(df.row_count()) + " rows");

    DataFrame thresholds = apply_thresholds(df, limits);
    DataFrame linearised = apply_linearisation(thresholds);
    DataFrame deviations = apply_deviations(linearised);
    DataFrame reductions = apply_reductions(deviations);
    DataFrame psi = apply_psi(reductions, limits);
    return apply_classification(psi, limits);
}

// ===== Scenario =====

ScenarioResult process_scenario(const std::string& name, const DataFrame& df,
                                const AnalysisConfig& config) {
    config.validate();

    try {
        ScenarioResult result;
        result.name = name;
        result.quality = data_quality_report(df);
        result.data = process_dataframe(df, config.limits);
        result.compliance = summarize_compliance(result.data);

        result.nonstationarity_columns = config.nonstationarity_columns.empty()
            ? default_nonstationarity_columns()
            : config.nonstationarity_columns;
        result.nonstationarity = compute_nonstationarity_row(
            name, result.data, result.nonstationarity_columns, config.nonstationarity_window);

        result.recovery = summarize_recovery(result.data, config.simulation,
                                             config.open_run_policy,
                                             config.recovery_histogram_bins);

        result.statistics = summarize_columns(
            result.data,
            config.statistics_columns.empty() ? default_statistics_columns()
                                              : config.statistics_columns);
        result.exceedance = compute_exceedance(
            result.data,
            config.exceedance_thresholds.empty() ? default_exceedance_thresholds()
                                                 : config.exceedance_thresholds);

        log_info("[PIPELINE] " + name + ": " + std::to_string(result.compliance.total_rows) +
                 " rows, " + std::to_string(result.compliance.non_compliant()) +
                 " non-compliant, " + std::to_string(result.recovery.count) +
                 " recovery episodes");
        return result;
    } catch (const std::exception& e) {
        throw ScenarioError(name, e.what());
    }
}

// ===== Multi-scenario =====

std::vector<ScenarioOutcome> analyze_scenarios(const std::vector<ScenarioInput>& inputs,
                                               const AnalysisConfig& config) {
    config.validate();

    std::vector<ScenarioOutcome> outcomes(inputs.size());
    const long count = static_cast<long>(inputs.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (long i = 0; i < count; ++i) {
        const ScenarioInput& input = inputs[static_cast<size_t>(i)];
        ScenarioOutcome& outcome = outcomes[static_cast<size_t>(i)];
        outcome.name = input.name;
        try {
            outcome.result = std::make_unique<ScenarioResult>(
                process_scenario(input.name, input.data, config));
        } catch (const std::exception& e) {
            outcome.error = e.what();
            log_error("[PIPELINE] " + outcome.error);
        }
    }

    return outcomes;
}

NonStationarityTable collect_nonstationarity(const std::vector<ScenarioOutcome>& outcomes) {
    NonStationarityTable table;
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            continue;
        }
        if (table.columns.empty()) {
            table.columns = outcome.result->nonstationarity_columns;
        }
        table.rows.push_back(outcome.result->nonstationarity);
    }
    return table;
}

} // namespace effluent
