#pragma once

#include "effluent/core/config.hpp"
#include "effluent/data/dataframe.hpp"

namespace effluent {

/// Threshold for one row: the configured limit, or NaN when the row's
/// influent value is missing
double threshold_for(double influent, double limit);

/// Adds BODut, BODlt, CODut, CODlt (mg/L limits broadcast per row)
///
/// Requires bod1 and cod1. The input table is not modified.
DataFrame apply_thresholds(const DataFrame& df, const ComplianceLimits& limits);

} // namespace effluent
