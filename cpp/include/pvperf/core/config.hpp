#pragma once

#include "pvperf/core/types.hpp"
#include <string>
#include <cstddef>

namespace pvperf {

/// Fixed physical layout of one source export.
/// Indices are 0-based physical rows / columns of the sheet.
struct ColumnMap {
    std::string sheet_name = "5 minutes";  ///< Expected sheet (empty = accept any)
    size_t header_row = 2;                 ///< Row carrying the column names
    size_t first_data_row = 3;             ///< First sample row
    size_t timestamp_column = 3;           ///< "Start Time" column
    size_t value_column = 4;               ///< Measurement column

    /// Layout of the plant's exports for a role:
    /// irradiance in column 4, revenue meter and inverter energy in column 5
    static ColumnMap for_role(SourceRole role);
};

/// Plant and threshold configuration threaded through every stage
struct AnalysisConfig {
    double pv_capacity_mwp = 2.06;       ///< Rated plant capacity (MWp), scaled by 1000 to kW
    double pr_threshold = 0.75;          ///< PR at or above this is Good
    double efficiency_threshold = 0.90;  ///< Inverter efficiency below this is low
    double soiling_factor = 0.9;         ///< PR below threshold * factor is soiling
    bool flag_sensor_outage = true;      ///< Label non-finite PR as SensorOutage
    bool parallel_inverters = false;     ///< Analyze inverter files concurrently

    /// Throws std::invalid_argument on a non-positive capacity or
    /// non-finite thresholds
    void validate() const;
};

} // namespace pvperf
