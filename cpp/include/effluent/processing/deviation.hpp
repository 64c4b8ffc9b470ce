#pragma once

#include "effluent/data/dataframe.hpp"

namespace effluent {

/// threshold - effluent; positive when the effluent is below the threshold
inline double deviation(double threshold, double effluent) {
    return threshold - effluent;
}

/// Fraction of the influent load removed: (influent - effluent) / influent
///
/// Zero influent gives 0.0; NaN operands give NaN.
double reduction(double influent, double effluent);

/// Adds BODlt-BODeffl, BODut-BODeffl, CODlt-CODeffl, CODut-CODeffl
/// (requires the threshold columns)
DataFrame apply_deviations(const DataFrame& df);

/// Adds reduction_BOD and reduction_COD
DataFrame apply_reductions(const DataFrame& df);

} // namespace effluent
