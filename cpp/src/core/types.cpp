#include "pvperf/core/types.hpp"

namespace pvperf {

std::string role_to_string(SourceRole role) {
    switch (role) {
        case SourceRole::IRRADIANCE: return "Irradiance";
        case SourceRole::REVENUE_METER: return "RevenueMeter";
        case SourceRole::INVERTER: return "Inverter";
        default: return "Unknown";
    }
}

std::string status_to_string(PerformanceStatus status) {
    switch (status) {
        case PerformanceStatus::GOOD: return "Good";
        case PerformanceStatus::NEEDS_ATTENTION: return "Needs Attention";
        default: return "Unknown";
    }
}

std::string issue_to_string(IssueLabel issue) {
    switch (issue) {
        case IssueLabel::NO_ISSUE: return "No Issue";
        case IssueLabel::CALIBRATION_NEEDED: return "Sensor Calibration Needed";
        case IssueLabel::MODULE_SOILING: return "Module Soiling";
        case IssueLabel::SENSOR_OUTAGE: return "Sensor Outage";
        default: return "Unknown";
    }
}

} // namespace pvperf
