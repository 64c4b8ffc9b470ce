#pragma once

#include "effluent/core/config.hpp"
#include "effluent/core/types.hpp"
#include "effluent/data/dataframe.hpp"
#include "effluent/processing/psi_calculator.hpp"

namespace effluent {

/// Breach flags for one pollutant and one row (true = breached)
struct PollutantFlags {
    bool lt;          ///< (lower threshold - effluent) < 0
    bool ut;          ///< (upper threshold - effluent) < 0
    bool reduction;   ///< reduction < required fraction
};

/// Everything the classifier needs for one pollutant and one row
struct PollutantState {
    PsiComponents psi;
    PollutantFlags flags;
};

/// Failure conditions met by one pollutant
struct PollutantFailure {
    bool lut_exceedance = false;   ///< psi_2 < 0, lower limit and reduction missed, upper limit held
    bool max_limit = false;        ///< psi_3 < 0, lower and upper limits and reduction all missed
};

/// Which aggregated metric a row reports
enum class MetricSelection {
    LUT,       ///< metric_lut
    MAX,       ///< metric_max, LUT and max conditions together
    DEFAULT    ///< max(bod psi_1, cod psi_1)
};

/// Classification of one row
struct RowClassification {
    FailType fail_type = FailType::COMPLIANT;
    FailSource fail_source = FailSource::NONE;
    MetricSelection selection = MetricSelection::DEFAULT;
    double metric = 0.0;
    PollutantFailure bod;
    PollutantFailure cod;
};

/// Breach flags from a row's deviations and reduction (NaN compares false)
PollutantFlags compute_flags(double lt_deviation, double ut_deviation,
                             double reduction, double required_pc);

/// LUT / max-limit conditions for one pollutant
PollutantFailure evaluate_pollutant(const PollutantState& state);

/// Classify one row. Max limit failures take precedence over LUT exceedances;
/// fail_source names the pollutants behind the selected branch.
RowClassification classify_row(const PollutantState& bod, const PollutantState& cod);

/// Adds flag_*, bod/cod_lut_exc, bod/cod_max_lim, metric, fail_type, fail_source
///
/// Requires the deviation, reduction and PSI columns.
DataFrame apply_classification(const DataFrame& df, const ComplianceLimits& limits);

} // namespace effluent
