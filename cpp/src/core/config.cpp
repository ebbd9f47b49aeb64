#include "pvperf/core/config.hpp"
#include <cmath>
#include <stdexcept>

namespace pvperf {

ColumnMap ColumnMap::for_role(SourceRole role) {
    ColumnMap map;
    switch (role) {
        case SourceRole::IRRADIANCE:
            map.value_column = 4;
            break;
        case SourceRole::REVENUE_METER:
        case SourceRole::INVERTER:
            map.value_column = 5;
            break;
    }
    return map;
}

void AnalysisConfig::validate() const {
    if (!std::isfinite(pv_capacity_mwp) || pv_capacity_mwp <= 0.0) {
        throw std::invalid_argument("AnalysisConfig: pv_capacity_mwp must be positive");
    }
    if (!std::isfinite(pr_threshold)) {
        throw std::invalid_argument("AnalysisConfig: pr_threshold must be finite");
    }
    if (!std::isfinite(efficiency_threshold)) {
        throw std::invalid_argument("AnalysisConfig: efficiency_threshold must be finite");
    }
    if (!std::isfinite(soiling_factor) || soiling_factor <= 0.0) {
        throw std::invalid_argument("AnalysisConfig: soiling_factor must be positive");
    }
}

} // namespace pvperf
