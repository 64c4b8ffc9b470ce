#include "effluent/processing/failure_classifier.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace effluent {

PollutantFlags compute_flags(double lt_deviation, double ut_deviation,
                             double reduction, double required_pc) {
    return PollutantFlags{
        lt_deviation < 0.0,
        ut_deviation < 0.0,
        reduction < required_pc,
    };
}

PollutantFailure evaluate_pollutant(const PollutantState& state) {
    const PollutantFlags& f = state.flags;
    PollutantFailure failure;
    failure.lut_exceedance = state.psi.psi_2 < 0.0 && f.lt && f.reduction && !f.ut;
    failure.max_limit = state.psi.psi_3 < 0.0 && f.lt && f.ut && f.reduction;
    return failure;
}

RowClassification classify_row(const PollutantState& bod, const PollutantState& cod) {
    RowClassification row;
    row.bod = evaluate_pollutant(bod);
    row.cod = evaluate_pollutant(cod);

    const bool any_max = row.bod.max_limit || row.cod.max_limit;
    const bool any_lut = row.bod.lut_exceedance || row.cod.lut_exceedance;

    if (any_max) {
        row.fail_type = FailType::MAX_LIMIT_FAILURE;
        if (row.bod.max_limit) row.fail_source = row.fail_source | FailSource::BOD;
        if (row.cod.max_limit) row.fail_source = row.fail_source | FailSource::COD;
    } else if (any_lut) {
        row.fail_type = FailType::LUT_EXCEEDANCE;
        if (row.bod.lut_exceedance) row.fail_source = row.fail_source | FailSource::BOD;
        if (row.cod.lut_exceedance) row.fail_source = row.fail_source | FailSource::COD;
    }

    // metric_max only when a LUT exceedance and a max limit failure coincide;
    // a max-only row keeps the default metric
    const bool cond_lut = any_lut && !any_max;
    const bool cond_max = any_lut && any_max;
    if (cond_lut) {
        row.selection = MetricSelection::LUT;
        row.metric = metric_lut(bod.psi, cod.psi);
    } else if (cond_max) {
        row.selection = MetricSelection::MAX;
        row.metric = metric_max(bod.psi, cod.psi);
    } else {
        row.selection = MetricSelection::DEFAULT;
        row.metric = metric_default(bod.psi, cod.psi);
    }

    return row;
}

DataFrame apply_classification(const DataFrame& df, const ComplianceLimits& limits) {
    const auto bod_lt = df.get_f64(columns::BOD_LT_DEV);
    const auto bod_ut = df.get_f64(columns::BOD_UT_DEV);
    const auto bod_red = df.get_f64(columns::BOD_REDUCTION);
    const auto cod_lt = df.get_f64(columns::COD_LT_DEV);
    const auto cod_ut = df.get_f64(columns::COD_UT_DEV);
    const auto cod_red = df.get_f64(columns::COD_REDUCTION);
    const auto bod_psi_1 = df.get_f64(columns::BOD_PSI_1);
    const auto bod_psi_2 = df.get_f64(columns::BOD_PSI_2);
    const auto bod_psi_3 = df.get_f64(columns::BOD_PSI_3);
    const auto cod_psi_1 = df.get_f64(columns::COD_PSI_1);
    const auto cod_psi_2 = df.get_f64(columns::COD_PSI_2);
    const auto cod_psi_3 = df.get_f64(columns::COD_PSI_3);

    const size_t n = df.row_count();
    std::vector<uint8_t> f_bod_lt(n), f_bod_ut(n), f_bod_red(n);
    std::vector<uint8_t> f_cod_lt(n), f_cod_ut(n), f_cod_red(n);
    std::vector<uint8_t> bod_lut(n), bod_max(n), cod_lut(n), cod_max(n);
    std::vector<double> metric(n);
    std::vector<std::string> fail_type(n), fail_source(n);

    for (size_t i = 0; i < n; ++i) {
        const PollutantState bod{
            {bod_psi_1[i], bod_psi_2[i], bod_psi_3[i]},
            compute_flags(bod_lt[i], bod_ut[i], bod_red[i], limits.bod_pc)};
        const PollutantState cod{
            {cod_psi_1[i], cod_psi_2[i], cod_psi_3[i]},
            compute_flags(cod_lt[i], cod_ut[i], cod_red[i], limits.cod_pc)};

        const RowClassification row = classify_row(bod, cod);

        f_bod_lt[i] = bod.flags.lt;
        f_bod_ut[i] = bod.flags.ut;
        f_bod_red[i] = bod.flags.reduction;
        f_cod_lt[i] = cod.flags.lt;
        f_cod_ut[i] = cod.flags.ut;
        f_cod_red[i] = cod.flags.reduction;
        bod_lut[i] = row.bod.lut_exceedance;
        bod_max[i] = row.bod.max_limit;
        cod_lut[i] = row.cod.lut_exceedance;
        cod_max[i] = row.cod.max_limit;
        metric[i] = row.metric;
        fail_type[i] = fail_type_to_string(row.fail_type);
        fail_source[i] = fail_source_to_string(row.fail_source);
    }

    DataFrame result = df.clone();
    result.add_bool(columns::FLAG_BOD_LT, std::move(f_bod_lt));
    result.add_bool(columns::FLAG_BOD_UT, std::move(f_bod_ut));
    result.add_bool(columns::FLAG_BOD_REDUCTION, std::move(f_bod_red));
    result.add_bool(columns::FLAG_COD_LT, std::move(f_cod_lt));
    result.add_bool(columns::FLAG_COD_UT, std::move(f_cod_ut));
    result.add_bool(columns::FLAG_COD_REDUCTION, std::move(f_cod_red));
    result.add_bool(columns::BOD_LUT_EXC, std::move(bod_lut));
    result.add_bool(columns::BOD_MAX_LIM, std::move(bod_max));
    result.add_bool(columns::COD_LUT_EXC, std::move(cod_lut));
    result.add_bool(columns::COD_MAX_LIM, std::move(cod_max));
    result.add_f64(columns::METRIC, std::move(metric));
    result.add_string(columns::FAIL_TYPE, std::move(fail_type));
    result.add_string(columns::FAIL_SOURCE, std::move(fail_source));
    return result;
}

} // namespace effluent
