#pragma once

#include "effluent/data/dataframe.hpp"
#include <span>
#include <vector>

namespace effluent {

/// Min-max scaling of a whole series: (x - min) / (max - min)
///
/// NaN is ignored when finding min/max and stays NaN in the output.
/// A constant series maps every non-NaN value to 0.0.
std::vector<double> linearise(std::span<const double> values);

/// Adds LIN_BODi, LIN_BODe, LIN_CODi, LIN_CODe from bod1, bod31, cod1, cod31
DataFrame apply_linearisation(const DataFrame& df);

} // namespace effluent
