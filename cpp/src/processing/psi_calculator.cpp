#include "effluent/processing/psi_calculator.hpp"
#include "effluent/core/types.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace effluent {

double nan_min(double a, double b) {
    if (std::isnan(a) || std::isnan(b)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::min(a, b);
}

double nan_max(double a, double b) {
    if (std::isnan(a) || std::isnan(b)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::max(a, b);
}

PsiTerms make_psi_terms(double lt_deviation, double ut_deviation,
                        double reduction, double required_pc) {
    return PsiTerms{lt_deviation, ut_deviation, reduction - required_pc};
}

double psi_1(const PsiTerms& t) {
    return nan_max(t.lt, nan_min(t.lt, t.pc));
}

double psi_2(const PsiTerms& t) {
    return nan_min(nan_min(t.lt, t.pc), t.ut);
}

double psi_3(const PsiTerms& t) {
    return nan_min(t.ut, t.pc);
}

PsiComponents compute_psi(const PsiTerms& t) {
    return PsiComponents{psi_1(t), psi_2(t), psi_3(t)};
}

double metric_lut(const PsiComponents& bod, const PsiComponents& cod) {
    return nan_min(bod.psi_2, cod.psi_2);
}

double metric_max(const PsiComponents& bod, const PsiComponents& cod) {
    return nan_min(bod.psi_3, cod.psi_3);
}

double metric_default(const PsiComponents& bod, const PsiComponents& cod) {
    return nan_max(bod.psi_1, cod.psi_1);
}

DataFrame apply_psi(const DataFrame& df, const ComplianceLimits& limits) {
    const auto bod_lt = df.get_f64(columns::BOD_LT_DEV);
    const auto bod_ut = df.get_f64(columns::BOD_UT_DEV);
    const auto bod_red = df.get_f64(columns::BOD_REDUCTION);
    const auto cod_lt = df.get_f64(columns::COD_LT_DEV);
    const auto cod_ut = df.get_f64(columns::COD_UT_DEV);
    const auto cod_red = df.get_f64(columns::COD_REDUCTION);

    const size_t n = df.row_count();
    std::vector<double> b1(n), b2(n), b3(n), c1(n), c2(n), c3(n), lut(n), max_metric(n);
    std::vector<uint8_t> c_bod_2(n), c_bod_3(n);

    for (size_t i = 0; i < n; ++i) {
        const PsiComponents bod = compute_psi(
            make_psi_terms(bod_lt[i], bod_ut[i], bod_red[i], limits.bod_pc));
        const PsiComponents cod = compute_psi(
            make_psi_terms(cod_lt[i], cod_ut[i], cod_red[i], limits.cod_pc));

        b1[i] = bod.psi_1;
        b2[i] = bod.psi_2;
        b3[i] = bod.psi_3;
        c1[i] = cod.psi_1;
        c2[i] = cod.psi_2;
        c3[i] = cod.psi_3;
        lut[i] = metric_lut(bod, cod);
        max_metric[i] = metric_max(bod, cod);
        c_bod_2[i] = bod.psi_2 < cod.psi_2;
        c_bod_3[i] = bod.psi_3 < cod.psi_3;
    }

    DataFrame result = df.clone();
    result.add_f64(columns::BOD_PSI_1, std::move(b1));
    result.add_f64(columns::BOD_PSI_2, std::move(b2));
    result.add_f64(columns::BOD_PSI_3, std::move(b3));
    result.add_f64(columns::COD_PSI_1, std::move(c1));
    result.add_f64(columns::COD_PSI_2, std::move(c2));
    result.add_f64(columns::COD_PSI_3, std::move(c3));
    result.add_f64(columns::METRIC_LUT, std::move(lut));
    result.add_f64(columns::METRIC_MAX, std::move(max_metric));
    result.add_bool(columns::C_BOD_2, std::move(c_bod_2));
    result.add_bool(columns::C_BOD_3, std::move(c_bod_3));
    return result;
}

} // namespace effluent
