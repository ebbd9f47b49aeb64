#include "pvperf/core/version.hpp"
#include "pvperf/statistics/arrow_utils.hpp"

namespace pvperf {

const char* Version::get_version_string() {
    static const std::string version =
        std::to_string(MAJOR) + "." + std::to_string(MINOR) + "." + std::to_string(PATCH);
    return version.c_str();
}

std::string Version::get_build_info() {
    return std::string("pv_perf ") + get_version_string() +
           " (arrow compute: " + (arrow_utils::is_arrow_available() ? "on" : "off") + ")";
}

} // namespace pvperf
