#pragma once

#include "effluent/core/config.hpp"
#include "effluent/data/dataframe.hpp"

namespace effluent {

/// Inputs of the PSI formulas for one pollutant and one row
struct PsiTerms {
    double lt;   ///< Lower-threshold deviation (threshold - effluent)
    double ut;   ///< Upper-threshold deviation
    double pc;   ///< Percentage term: reduction achieved minus the required fraction
};

/// PSI components for one pollutant and one row
struct PsiComponents {
    double psi_1;   ///< max(lt, min(lt, pc))
    double psi_2;   ///< min(lt, pc, ut), LUT score
    double psi_3;   ///< min(ut, pc), max-limit score
};

/// min/max that return NaN if either operand is NaN
double nan_min(double a, double b);
double nan_max(double a, double b);

/// Build the terms from a row's deviations and reduction
PsiTerms make_psi_terms(double lt_deviation, double ut_deviation,
                        double reduction, double required_pc);

double psi_1(const PsiTerms& t);
double psi_2(const PsiTerms& t);
double psi_3(const PsiTerms& t);
PsiComponents compute_psi(const PsiTerms& t);

/// min(bod psi_2, cod psi_2)
double metric_lut(const PsiComponents& bod, const PsiComponents& cod);

/// min(bod psi_3, cod psi_3)
double metric_max(const PsiComponents& bod, const PsiComponents& cod);

/// max(bod psi_1, cod psi_1), the metric for rows with no failure selected
double metric_default(const PsiComponents& bod, const PsiComponents& cod);

/// Adds bod_psi_1..3, cod_psi_1..3, metric_lut, metric_max, c_BOD_2, c_BOD_3
///
/// Requires the deviation and reduction columns.
DataFrame apply_psi(const DataFrame& df, const ComplianceLimits& limits);

} // namespace effluent
