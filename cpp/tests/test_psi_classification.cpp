#include "test_common.hpp"

#include "effluent/core/config.hpp"
#include "effluent/processing/compliance_pipeline.hpp"
#include "effluent/processing/failure_classifier.hpp"
#include "effluent/processing/psi_calculator.hpp"

#include <limits>
#include <tuple>

using namespace effluent;
using namespace effluent::test;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

PollutantState state(double lt_dev, double ut_dev, double red, double pc) {
    return PollutantState{compute_psi(make_psi_terms(lt_dev, ut_dev, red, pc)),
                          compute_flags(lt_dev, ut_dev, red, pc)};
}

void runPsiFormulaTests() {
    // BOD 200 -> 10 under default limits
    const PsiComponents ok = compute_psi(make_psi_terms(15.0, 40.0, 0.95, 0.7));
    REQUIRE_NEAR(ok.psi_1, 15.0, 1e-12, "psi_1 = max(lt, min(lt, pc))");
    REQUIRE_NEAR(ok.psi_2, 0.25, 1e-12, "psi_2 = min(lt, pc, ut)");
    REQUIRE_NEAR(ok.psi_3, 0.25, 1e-12, "psi_3 = min(ut, pc)");

    // BOD 100 -> 60: every term negative
    const PsiComponents bad = compute_psi(make_psi_terms(-35.0, -10.0, 0.4, 0.7));
    REQUIRE_NEAR(bad.psi_1, -35.0, 1e-12, "psi_1 breached");
    REQUIRE_NEAR(bad.psi_2, -35.0, 1e-12, "psi_2 breached");
    REQUIRE_NEAR(bad.psi_3, -10.0, 1e-12, "psi_3 breached");

    // psi_2 is negative as soon as any of its terms is
    REQUIRE(psi_2(PsiTerms{5.0, 5.0, -0.01}) < 0.0, "negative pc term");
    REQUIRE(psi_2(PsiTerms{5.0, -1.0, 0.2}) < 0.0, "negative ut term");
    REQUIRE(psi_2(PsiTerms{-1.0, 5.0, 0.2}) < 0.0, "negative lt term");
    REQUIRE(psi_2(PsiTerms{1.0, 5.0, 0.2}) > 0.0, "all terms positive");

    // Reduction exactly at the requirement gives a zero pc term
    REQUIRE(make_psi_terms(1.0, 2.0, 0.7, 0.7).pc == 0.0, "pc term at requirement");

    REQUIRE(std::isnan(psi_1(PsiTerms{NaN, 1.0, 1.0})), "NaN propagates through psi_1");
    REQUIRE(std::isnan(nan_min(1.0, NaN)), "nan_min propagates");
    REQUIRE(std::isnan(nan_max(NaN, 1.0)), "nan_max propagates");

    const PsiComponents a{1.0, -2.0, -3.0};
    const PsiComponents b{4.0, -1.0, 5.0};
    REQUIRE(metric_lut(a, b) == -2.0, "metric_lut = min psi_2");
    REQUIRE(metric_max(a, b) == -3.0, "metric_max = min psi_3");
    REQUIRE(metric_default(a, b) == 4.0, "default metric = max psi_1");
}

void runFlagTests() {
    const PollutantFlags clean = compute_flags(15.0, 40.0, 0.95, 0.7);
    REQUIRE(!clean.lt && !clean.ut && !clean.reduction, "nothing breached");

    const PollutantFlags all = compute_flags(-35.0, -10.0, 0.4, 0.7);
    REQUIRE(all.lt && all.ut && all.reduction, "everything breached");

    const PollutantFlags at_limit = compute_flags(0.0, 0.0, 0.7, 0.7);
    REQUIRE(!at_limit.lt && !at_limit.ut && !at_limit.reduction, "limits are inclusive");

    const PollutantFlags nan = compute_flags(NaN, NaN, NaN, 0.7);
    REQUIRE(!nan.lt && !nan.ut && !nan.reduction, "NaN never flags");
}

void runRowClassificationTests() {
    const PollutantState bod_ok = state(15.0, 40.0, 0.95, 0.7);
    const PollutantState cod_ok = state(75.0, 200.0, 0.9, 0.75);
    const PollutantState bod_max = state(-35.0, -10.0, 0.4, 0.7);
    const PollutantState bod_lut = state(-15.0, 10.0, 0.6, 0.7);
    const PollutantState cod_max = state(-175.0, -50.0, 0.4, 0.75);
    const PollutantState cod_lut = state(-75.0, 50.0, 0.6, 0.75);

    RowClassification row = classify_row(bod_ok, cod_ok);
    REQUIRE(row.fail_type == FailType::COMPLIANT, "compliant row");
    REQUIRE(row.fail_source == FailSource::NONE, "no source when compliant");
    REQUIRE(row.selection == MetricSelection::DEFAULT, "default metric");
    REQUIRE_NEAR(row.metric, 75.0, 1e-12, "default metric = max(15, 75)");

    row = classify_row(bod_max, cod_ok);
    REQUIRE(row.fail_type == FailType::MAX_LIMIT_FAILURE, "BOD max limit failure");
    REQUIRE(row.fail_source == FailSource::BOD, "BOD source");
    REQUIRE(row.selection == MetricSelection::DEFAULT, "max-only row keeps default metric");
    REQUIRE_NEAR(row.metric, 75.0, 1e-12, "default metric = max(-35, 75)");
    REQUIRE(row.bod.max_limit && !row.bod.lut_exceedance, "BOD condition");

    row = classify_row(bod_lut, cod_ok);
    REQUIRE(row.fail_type == FailType::LUT_EXCEEDANCE, "BOD LUT exceedance");
    REQUIRE(row.fail_source == FailSource::BOD, "BOD source");
    REQUIRE(row.selection == MetricSelection::LUT, "LUT metric");
    REQUIRE_NEAR(row.metric, -15.0, 1e-12, "metric_lut = min(-15, 0.15)");

    row = classify_row(bod_ok, cod_lut);
    REQUIRE(row.fail_type == FailType::LUT_EXCEEDANCE, "COD LUT exceedance");
    REQUIRE(row.fail_source == FailSource::COD, "COD source");

    row = classify_row(bod_max, cod_max);
    REQUIRE(row.fail_type == FailType::MAX_LIMIT_FAILURE, "both max");
    REQUIRE(row.fail_source == FailSource::BOTH, "BOD+COD source");
    REQUIRE(row.selection == MetricSelection::DEFAULT, "no LUT exceedance: default metric");
    REQUIRE_NEAR(row.metric, -35.0, 1e-12, "default metric = max(-35, -175)");
    REQUIRE(std::string(fail_source_to_string(row.fail_source)) == "BOD+COD", "label");

    row = classify_row(bod_lut, cod_lut);
    REQUIRE(row.fail_type == FailType::LUT_EXCEEDANCE, "both LUT");
    REQUIRE(row.fail_source == FailSource::BOTH, "BOD+COD LUT source");

    // Max limit failure takes precedence over a LUT exceedance on the other pollutant,
    // and the pair selects metric_max
    row = classify_row(bod_lut, cod_max);
    REQUIRE(row.fail_type == FailType::MAX_LIMIT_FAILURE, "max wins");
    REQUIRE(row.fail_source == FailSource::COD, "source follows the max branch");
    REQUIRE(row.selection == MetricSelection::MAX, "max metric selected");
    REQUIRE_NEAR(row.metric, -50.0, 1e-12, "metric_max = min(-0.1, -50)");

    // Lower limit missed but reduction achieved: compliant
    row = classify_row(state(-5.0, 20.0, 0.97, 0.7), cod_ok);
    REQUIRE(row.fail_type == FailType::COMPLIANT, "reduction rescues lower breach");

    // Upper limit missed but reduction achieved: compliant
    row = classify_row(state(-30.0, -5.0, 0.9, 0.7), cod_ok);
    REQUIRE(row.fail_type == FailType::COMPLIANT, "reduction rescues upper breach");

    // Missing data never fails
    row = classify_row(state(NaN, NaN, NaN, 0.7), state(NaN, NaN, NaN, 0.75));
    REQUIRE(row.fail_type == FailType::COMPLIANT, "NaN row is compliant");
    REQUIRE(std::isnan(row.metric), "NaN metric");
}

void runTableTests() {
    const ComplianceLimits limits;
    DataFrame df = process_dataframe(
        make_frame({COMPLIANT, BOD_MAX, BOD_LUT, COD_MAX, COD_LUT, BOTH_MAX}), limits);
    REQUIRE(df.row_count() == 6, "row count preserved");

    const auto fail_type = df.get_string(columns::FAIL_TYPE);
    const auto fail_source = df.get_string(columns::FAIL_SOURCE);
    REQUIRE(fail_type[0] == "Compliant" && fail_source[0].empty(), "row 0");
    REQUIRE(fail_type[1] == "Max Limit Failure" && fail_source[1] == "BOD", "row 1");
    REQUIRE(fail_type[2] == "LUT Exceedance" && fail_source[2] == "BOD", "row 2");
    REQUIRE(fail_type[3] == "Max Limit Failure" && fail_source[3] == "COD", "row 3");
    REQUIRE(fail_type[4] == "LUT Exceedance" && fail_source[4] == "COD", "row 4");
    REQUIRE(fail_type[5] == "Max Limit Failure" && fail_source[5] == "BOD+COD", "row 5");

    const auto bod_max = df.get_bool(columns::BOD_MAX_LIM);
    const auto bod_lut = df.get_bool(columns::BOD_LUT_EXC);
    const auto flag_ut = df.get_bool(columns::FLAG_BOD_UT);
    REQUIRE(bod_max[1] == 1 && bod_lut[1] == 0, "bod_max_lim on row 1");
    REQUIRE(bod_max[2] == 0 && bod_lut[2] == 1, "bod_lut_exc on row 2");
    REQUIRE(flag_ut[1] == 1 && flag_ut[2] == 0, "upper flag");

    const auto metric = df.get_f64(columns::METRIC);
    REQUIRE_NEAR(metric[0], 75.0, 1e-12, "compliant row metric");
    REQUIRE_NEAR(metric[1], 75.0, 1e-12, "max-only row uses the default metric");
    REQUIRE_NEAR(metric[2], -15.0, 1e-12, "LUT row metric");
    REQUIRE_NEAR(metric[5], -35.0, 1e-12, "both-max row uses the default metric");

    // Compliant BOD psi_2 (0.25) is not below COD psi_2 (0.15)
    const auto c_bod_2 = df.get_bool(columns::C_BOD_2);
    const auto c_bod_3 = df.get_bool(columns::C_BOD_3);
    REQUIRE(c_bod_2[0] == 0 && c_bod_3[0] == 0, "c_BOD flags on compliant row");
    REQUIRE(c_bod_2[1] == 1 && c_bod_3[1] == 1, "c_BOD flags when BOD fails");
    REQUIRE(c_bod_2[3] == 0 && c_bod_3[3] == 0, "c_BOD flags when COD fails");

    // Every row has exactly one type; a source exactly when non-compliant
    for (size_t i = 0; i < df.row_count(); ++i) {
        const FailType type = fail_type_from_string(fail_type[i]);
        REQUIRE(is_non_compliant(type) == !fail_source[i].empty(), "source iff non-compliant");
    }

    // psi_2 never exceeds psi_1 or psi_3
    for (const auto& [p1, p2, p3] : {std::tuple{columns::BOD_PSI_1, columns::BOD_PSI_2, columns::BOD_PSI_3},
                                     std::tuple{columns::COD_PSI_1, columns::COD_PSI_2, columns::COD_PSI_3}}) {
        const auto psi1 = df.get_f64(p1);
        const auto psi2 = df.get_f64(p2);
        const auto psi3 = df.get_f64(p3);
        for (size_t i = 0; i < df.row_count(); ++i) {
            REQUIRE(psi2[i] <= psi1[i] && psi2[i] <= psi3[i], "psi ordering");
        }
    }

    REQUIRE(df.column_type(columns::C_BOD_2) == ColumnType::BOOL, "c_BOD_2 is bool");
    REQUIRE(df.column_type(columns::FAIL_TYPE) == ColumnType::STRING, "fail_type is string");
}

} // namespace

int main() {
    runPsiFormulaTests();
    runFlagTests();
    runRowClassificationTests();
    runTableTests();
    std::cout << "[PASS] test_psi_classification\n";
    return 0;
}
