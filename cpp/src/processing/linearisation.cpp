#include "effluent/processing/linearisation.hpp"
#include "effluent/core/types.hpp"
#include "effluent/statistics/statistics_engine.hpp"
#include <cmath>

namespace effluent {

std::vector<double> linearise(std::span<const double> values) {
    double min_val, max_val;
    StatisticsEngine::calculate_min_max(values.data(), values.size(), min_val, max_val);

    std::vector<double> out;
    out.reserve(values.size());

    // All-NaN (or empty) series: nothing to scale against
    if (std::isnan(min_val)) {
        out.assign(values.begin(), values.end());
        return out;
    }

    const double range = max_val - min_val;
    for (double v : values) {
        if (std::isnan(v)) {
            out.push_back(v);
        } else if (range == 0.0) {
            out.push_back(0.0);
        } else {
            out.push_back((v - min_val) / range);
        }
    }
    return out;
}

DataFrame apply_linearisation(const DataFrame& df) {
    DataFrame result = df.clone();
    result.add_f64(columns::LIN_BOD_I, linearise(df.get_f64(columns::BOD_INFLUENT)));
    result.add_f64(columns::LIN_BOD_E, linearise(df.get_f64(columns::BOD_EFFLUENT)));
    result.add_f64(columns::LIN_COD_I, linearise(df.get_f64(columns::COD_INFLUENT)));
    result.add_f64(columns::LIN_COD_E, linearise(df.get_f64(columns::COD_EFFLUENT)));
    return result;
}

} // namespace effluent
