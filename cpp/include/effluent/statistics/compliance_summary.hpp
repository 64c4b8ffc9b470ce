#pragma once

#include "effluent/data/dataframe.hpp"
#include <cstddef>
#include <optional>

namespace effluent {

/// Classification counts for one classified table
struct ComplianceSummary {
    size_t total_rows = 0;
    size_t compliant = 0;
    size_t lut_exceedance = 0;
    size_t max_limit_failure = 0;

    size_t source_bod = 0;       ///< Rows failing on BOD only
    size_t source_cod = 0;       ///< Rows failing on COD only
    size_t source_both = 0;      ///< Rows failing on BOD and COD
    size_t pass_source = 0;      ///< Rows with no failure source

    size_t c_bod_2 = 0;          ///< Rows where BOD psi_2 < COD psi_2
    size_t c_bod_3 = 0;          ///< Rows where BOD psi_3 < COD psi_3

    std::optional<double> compliant_fraction;   ///< Undefined for zero rows

    /// Rows that are not compliant
    size_t non_compliant() const { return lut_exceedance + max_limit_failure; }
};

/// Count classifications; requires fail_type, fail_source, c_BOD_2, c_BOD_3
/// @throws std::invalid_argument for unknown fail_type labels
ComplianceSummary summarize_compliance(const DataFrame& df);

} // namespace effluent
