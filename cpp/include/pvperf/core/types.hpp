#pragma once

/**
 * @file types.hpp
 * @brief Canonical row types shared by every stage of the PV analysis
 *
 * All stages exchange plain value types: a loaded series is a vector of
 * TimeSeriesRow, the performance ratio stage produces PRRow, and the
 * inverter stage produces one InverterSummary per inverter file.
 */

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace pvperf {

/// Timestamp key as it appears in the source export (trimmed cell text).
/// Joins compare timestamps by exact equality.
using Timestamp = std::string;

/// Which physical source a raw table comes from
enum class SourceRole {
    IRRADIANCE,     ///< Environmental monitor (EM), irradiance sensor
    REVENUE_METER,  ///< Revenue meter (RM), delivered energy in kWh
    INVERTER        ///< Single inverter, energy output in kWh
};

/// Interval health derived from the performance ratio
enum class PerformanceStatus {
    GOOD,
    NEEDS_ATTENTION
};

/// Diagnostic label attached to every PR row
enum class IssueLabel {
    NO_ISSUE,
    CALIBRATION_NEEDED,
    MODULE_SOILING,
    SENSOR_OUTAGE   ///< PR is undefined (zero irradiance)
};

/// One sanitized sample: value is always finite and non-negative
struct TimeSeriesRow {
    Timestamp timestamp;
    double value = 0.0;
};

using TimeSeries = std::vector<TimeSeriesRow>;

/// One joined irradiance / revenue-meter interval
struct PRRow {
    Timestamp timestamp;
    double irradiance = 0.0;
    double energy_kwh = 0.0;
    double pr = 0.0;    ///< Non-finite when irradiance is zero
    PerformanceStatus status = PerformanceStatus::NEEDS_ATTENTION;
    IssueLabel issue = IssueLabel::NO_ISSUE;
};

/// Rows of one inverter file, identified by its source (file name)
struct InverterSet {
    std::string source_id;
    TimeSeries rows;
};

/// Efficiency summary of one inverter file
struct InverterSummary {
    std::string source_id;
    size_t matched_rows = 0;          ///< Rows sharing a timestamp with the PR rows
    size_t evaluated_rows = 0;        ///< Matched rows with positive simulated energy
    size_t low_efficiency_count = 0;
    std::optional<double> mean_efficiency;  ///< Empty when nothing was evaluated
};

/// Helpers for type to string conversion
std::string role_to_string(SourceRole role);
std::string status_to_string(PerformanceStatus status);
std::string issue_to_string(IssueLabel issue);

} // namespace pvperf
