#include "effluent/statistics/compliance_summary.hpp"
#include "effluent/core/types.hpp"

namespace effluent {

ComplianceSummary summarize_compliance(const DataFrame& df) {
    const auto fail_types = df.get_string(columns::FAIL_TYPE);
    const auto fail_sources = df.get_string(columns::FAIL_SOURCE);
    const auto c_bod_2 = df.get_bool(columns::C_BOD_2);
    const auto c_bod_3 = df.get_bool(columns::C_BOD_3);

    const std::string bod = fail_source_to_string(FailSource::BOD);
    const std::string cod = fail_source_to_string(FailSource::COD);
    const std::string both = fail_source_to_string(FailSource::BOTH);

    ComplianceSummary summary;
    summary.total_rows = df.row_count();

    for (size_t i = 0; i < summary.total_rows; ++i) {
        switch (fail_type_from_string(fail_types[i])) {
            case FailType::COMPLIANT:         summary.compliant++; break;
            case FailType::LUT_EXCEEDANCE:    summary.lut_exceedance++; break;
            case FailType::MAX_LIMIT_FAILURE: summary.max_limit_failure++; break;
        }

        if (fail_sources[i] == bod) {
            summary.source_bod++;
        } else if (fail_sources[i] == cod) {
            summary.source_cod++;
        } else if (fail_sources[i] == both) {
            summary.source_both++;
        } else if (fail_sources[i].empty()) {
            summary.pass_source++;
        }

        summary.c_bod_2 += c_bod_2[i] ? 1 : 0;
        summary.c_bod_3 += c_bod_3[i] ? 1 : 0;
    }

    if (summary.total_rows > 0) {
        summary.compliant_fraction =
            static_cast<double>(summary.compliant) / static_cast<double>(summary.total_rows);
    }
    return summary;
}

} // namespace effluent
