#pragma once

#include <string>

namespace effluent {

/// Library version and the optional accelerators compiled in
struct Version {
    static constexpr int MAJOR = EFFLUENT_VERSION_MAJOR;
    static constexpr int MINOR = EFFLUENT_VERSION_MINOR;
    static constexpr int PATCH = EFFLUENT_VERSION_PATCH;

    static const char* get_version_string();

    /// Built with Apache Arrow compute kernels (HAVE_ARROW)
    static constexpr bool has_arrow() {
#ifdef HAVE_ARROW
        return true;
#else
        return false;
#endif
    }

    /// Built with OpenMP scenario parallelism (HAVE_OPENMP)
    static constexpr bool has_openmp() {
#ifdef HAVE_OPENMP
        return true;
#else
        return false;
#endif
    }

    /// "effluent 1.0.0 (arrow, openmp)", or "(scalar)" without accelerators
    static std::string get_build_info();
};

} // namespace effluent
