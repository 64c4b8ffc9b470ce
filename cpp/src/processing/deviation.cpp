#include "effluent/processing/deviation.hpp"
#include "effluent/core/types.hpp"
#include <cmath>
#include <limits>
#include <span>
#include <vector>

namespace effluent {

namespace {

std::vector<double> deviation_column(std::span<const double> threshold,
                                     std::span<const double> effluent) {
    std::vector<double> out(threshold.size());
    for (size_t i = 0; i < threshold.size(); ++i) {
        out[i] = deviation(threshold[i], effluent[i]);
    }
    return out;
}

std::vector<double> reduction_column(std::span<const double> influent,
                                     std::span<const double> effluent) {
    std::vector<double> out(influent.size());
    for (size_t i = 0; i < influent.size(); ++i) {
        out[i] = reduction(influent[i], effluent[i]);
    }
    return out;
}

} // namespace

double reduction(double influent, double effluent) {
    if (std::isnan(influent) || std::isnan(effluent)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (influent == 0.0) {
        return 0.0;
    }
    return (influent - effluent) / influent;
}

DataFrame apply_deviations(const DataFrame& df) {
    const auto bod_e = df.get_f64(columns::BOD_EFFLUENT);
    const auto cod_e = df.get_f64(columns::COD_EFFLUENT);

    DataFrame result = df.clone();
    result.add_f64(columns::BOD_LT_DEV, deviation_column(df.get_f64(columns::BOD_LT), bod_e));
    result.add_f64(columns::BOD_UT_DEV, deviation_column(df.get_f64(columns::BOD_UT), bod_e));
    result.add_f64(columns::COD_LT_DEV, deviation_column(df.get_f64(columns::COD_LT), cod_e));
    result.add_f64(columns::COD_UT_DEV, deviation_column(df.get_f64(columns::COD_UT), cod_e));
    return result;
}

DataFrame apply_reductions(const DataFrame& df) {
    DataFrame result = df.clone();
    result.add_f64(columns::BOD_REDUCTION,
                   reduction_column(df.get_f64(columns::BOD_INFLUENT),
                                    df.get_f64(columns::BOD_EFFLUENT)));
    result.add_f64(columns::COD_REDUCTION,
                   reduction_column(df.get_f64(columns::COD_INFLUENT),
                                    df.get_f64(columns::COD_EFFLUENT)));
    return result;
}

} // namespace effluent
