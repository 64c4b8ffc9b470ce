#pragma once

/**
 * @file types.hpp
 * @brief Core value types and column names shared by the compliance engine
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace effluent {

// ============================================================================
// Classification
// ============================================================================

/// Per-row failure type
enum class FailType : uint8_t {
    COMPLIANT,
    LUT_EXCEEDANCE,
    MAX_LIMIT_FAILURE
};

/// Display label ("Compliant", "LUT Exceedance", "Max Limit Failure")
const char* fail_type_to_string(FailType type);

/// Parse a display label back into a FailType
/// @throws std::invalid_argument for unknown labels
FailType fail_type_from_string(std::string_view label);

/// True for every type other than COMPLIANT
inline bool is_non_compliant(FailType type) {
    return type != FailType::COMPLIANT;
}

/// Pollutant that triggered a failure (bit set, BOD | COD allowed)
enum class FailSource : uint8_t {
    NONE = 0,
    BOD = 1,
    COD = 2,
    BOTH = 3
};

inline FailSource operator|(FailSource a, FailSource b) {
    return static_cast<FailSource>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

/// "BOD", "COD", "BOD+COD", or "" for NONE
const char* fail_source_to_string(FailSource source);

// ============================================================================
// Column names
// ============================================================================

namespace columns {

// Raw observation columns
inline constexpr const char* BOD_INFLUENT = "bod1";
inline constexpr const char* COD_INFLUENT = "cod1";
inline constexpr const char* SNH_INFLUENT = "snh1";
inline constexpr const char* BOD_EFFLUENT = "bod31";
inline constexpr const char* COD_EFFLUENT = "cod31";
inline constexpr const char* SNH_EFFLUENT = "snh31";

// Thresholds
inline constexpr const char* BOD_UT = "BODut";
inline constexpr const char* BOD_LT = "BODlt";
inline constexpr const char* COD_UT = "CODut";
inline constexpr const char* COD_LT = "CODlt";

// Linearised values
inline constexpr const char* LIN_BOD_I = "LIN_BODi";
inline constexpr const char* LIN_BOD_E = "LIN_BODe";
inline constexpr const char* LIN_COD_I = "LIN_CODi";
inline constexpr const char* LIN_COD_E = "LIN_CODe";

// Deviations (threshold - effluent)
inline constexpr const char* BOD_LT_DEV = "BODlt-BODeffl";
inline constexpr const char* BOD_UT_DEV = "BODut-BODeffl";
inline constexpr const char* COD_LT_DEV = "CODlt-CODeffl";
inline constexpr const char* COD_UT_DEV = "CODut-CODeffl";

// Reductions
inline constexpr const char* BOD_REDUCTION = "reduction_BOD";
inline constexpr const char* COD_REDUCTION = "reduction_COD";

// PSI components and metrics
inline constexpr const char* BOD_PSI_1 = "bod_psi_1";
inline constexpr const char* BOD_PSI_2 = "bod_psi_2";
inline constexpr const char* BOD_PSI_3 = "bod_psi_3";
inline constexpr const char* COD_PSI_1 = "cod_psi_1";
inline constexpr const char* COD_PSI_2 = "cod_psi_2";
inline constexpr const char* COD_PSI_3 = "cod_psi_3";
inline constexpr const char* METRIC_LUT = "metric_lut";
inline constexpr const char* METRIC_MAX = "metric_max";
inline constexpr const char* METRIC = "metric";
inline constexpr const char* C_BOD_2 = "c_BOD_2";
inline constexpr const char* C_BOD_3 = "c_BOD_3";

// Flags (true = breached)
inline constexpr const char* FLAG_BOD_LT = "flag_BODlt";
inline constexpr const char* FLAG_BOD_UT = "flag_BODut";
inline constexpr const char* FLAG_BOD_REDUCTION = "flag_reduction_BOD";
inline constexpr const char* FLAG_COD_LT = "flag_CODlt";
inline constexpr const char* FLAG_COD_UT = "flag_CODut";
inline constexpr const char* FLAG_COD_REDUCTION = "flag_reduction_COD";

// Per-pollutant failure conditions
inline constexpr const char* BOD_LUT_EXC = "bod_lut_exc";
inline constexpr const char* BOD_MAX_LIM = "bod_max_lim";
inline constexpr const char* COD_LUT_EXC = "cod_lut_exc";
inline constexpr const char* COD_MAX_LIM = "cod_max_lim";

// Classification
inline constexpr const char* FAIL_TYPE = "fail_type";
inline constexpr const char* FAIL_SOURCE = "fail_source";

/// Columns every input table must carry
inline constexpr std::array<const char*, 6> REQUIRED = {
    BOD_INFLUENT, COD_INFLUENT, BOD_EFFLUENT, COD_EFFLUENT, SNH_INFLUENT, SNH_EFFLUENT
};

/// Linearised columns scored for non-stationarity by default
inline constexpr std::array<const char*, 4> LINEARISED = {
    LIN_BOD_I, LIN_BOD_E, LIN_COD_I, LIN_COD_E
};

} // namespace columns

} // namespace effluent
