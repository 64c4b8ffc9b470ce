#include "effluent/core/version.hpp"
#include <sstream>
#include <vector>

namespace effluent {

const char* Version::get_version_string() {
    static const std::string version = [] {
        std::ostringstream oss;
        oss << MAJOR << "." << MINOR << "." << PATCH;
        return oss.str();
    }();
    return version.c_str();
}

std::string Version::get_build_info() {
    std::vector<const char*> features;
    if (has_arrow()) features.push_back("arrow");
    if (has_openmp()) features.push_back("openmp");

    std::ostringstream oss;
    oss << "effluent " << get_version_string() << " (";
    if (features.empty()) {
        oss << "scalar";
    }
    for (size_t i = 0; i < features.size(); ++i) {
        oss << (i ? ", " : "") << features[i];
    }
    oss << ")";
    return oss.str();
}

} // namespace effluent
