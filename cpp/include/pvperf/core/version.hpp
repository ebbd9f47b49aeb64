#pragma once

#include <string>

namespace pvperf {

/// Library version, injected by the build as PV_VERSION_* definitions
struct Version {
    static constexpr int MAJOR = PV_VERSION_MAJOR;
    static constexpr int MINOR = PV_VERSION_MINOR;
    static constexpr int PATCH = PV_VERSION_PATCH;

    /// "MAJOR.MINOR.PATCH"
    static const char* get_version_string();

    /// Version plus the optional backends compiled in,
    /// e.g. "pv_perf 1.0.0 (arrow compute: off)"
    static std::string get_build_info();
};

} // namespace pvperf
