#include "effluent/core/types.hpp"
#include <stdexcept>

namespace effluent {

const char* fail_type_to_string(FailType type) {
    switch (type) {
        case FailType::COMPLIANT: return "Compliant";
        case FailType::LUT_EXCEEDANCE: return "LUT Exceedance";
        case FailType::MAX_LIMIT_FAILURE: return "Max Limit Failure";
        default: return "Unknown";
    }
}

FailType fail_type_from_string(std::string_view label) {
    if (label == "Compliant") return FailType::COMPLIANT;
    if (label == "LUT Exceedance") return FailType::LUT_EXCEEDANCE;
    if (label == "Max Limit Failure") return FailType::MAX_LIMIT_FAILURE;
    throw std::invalid_argument("Unknown fail type: " + std::string(label));
}

const char* fail_source_to_string(FailSource source) {
    switch (source) {
        case FailSource::NONE: return "";
        case FailSource::BOD: return "BOD";
        case FailSource::COD: return "COD";
        case FailSource::BOTH: return "BOD+COD";
        default: return "";
    }
}

} // namespace effluent
