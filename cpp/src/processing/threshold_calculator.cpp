#include "effluent/processing/threshold_calculator.hpp"
#include "effluent/core/types.hpp"
#include <cmath>
#include <limits>
#include <span>
#include <vector>

namespace effluent {

namespace {

std::vector<double> broadcast(std::span<const double> influent, double limit) {
    std::vector<double> out;
    out.reserve(influent.size());
    for (double value : influent) {
        out.push_back(threshold_for(value, limit));
    }
    return out;
}

} // namespace

double threshold_for(double influent, double limit) {
    if (std::isnan(influent)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return limit;
}

DataFrame apply_thresholds(const DataFrame& df, const ComplianceLimits& limits) {
    const auto bod_in = df.get_f64(columns::BOD_INFLUENT);
    const auto cod_in = df.get_f64(columns::COD_INFLUENT);

    DataFrame result = df.clone();
    result.add_f64(columns::BOD_UT, broadcast(bod_in, limits.bod_upper));
    result.add_f64(columns::BOD_LT, broadcast(bod_in, limits.bod_lower));
    result.add_f64(columns::COD_UT, broadcast(cod_in, limits.cod_upper));
    result.add_f64(columns::COD_LT, broadcast(cod_in, limits.cod_lower));
    return result;
}

} // namespace effluent
