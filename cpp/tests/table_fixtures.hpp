#pragma once

#include "pvperf/core/types.hpp"
#include "pvperf/data/raw_table.hpp"
#include <string>
#include <utility>
#include <vector>

namespace pvperf {
namespace fixtures {

/// Raw export laid out like the plant's "5 minutes" sheets: two label rows,
/// the header on row 2, then samples with the time in column 3 and the
/// measurement in value_col.
inline RawTable make_export(
    const std::string& source_id,
    size_t value_col,
    const std::vector<std::pair<std::string, std::string>>& samples
) {
    RawTable table;
    table.source_id = source_id;
    table.sheet_name = "5 minutes";
    table.rows.push_back({"Report", source_id});
    table.rows.push_back({"Period", "5 minutes"});
    table.rows.push_back({"Site", "Device", "Interval", "Start Time", "Irradiance", "Active Energy (kWh)"});
    for (const auto& [ts, value] : samples) {
        std::vector<std::string> row(6);
        row[0] = "PLANT-A";
        row[1] = source_id;
        row[2] = "5";
        row[3] = ts;
        row[value_col] = value;
        table.rows.push_back(std::move(row));
    }
    return table;
}

inline RawTable make_em(const std::string& id,
                        const std::vector<std::pair<std::string, std::string>>& samples) {
    return make_export(id, 4, samples);
}

inline RawTable make_rm(const std::string& id,
                        const std::vector<std::pair<std::string, std::string>>& samples) {
    return make_export(id, 5, samples);
}

inline RawTable make_inverter(const std::string& id,
                              const std::vector<std::pair<std::string, std::string>>& samples) {
    return make_export(id, 5, samples);
}

inline TimeSeries series(const std::vector<std::pair<std::string, double>>& samples) {
    TimeSeries out;
    for (const auto& [ts, v] : samples) {
        out.push_back(TimeSeriesRow{ts, v});
    }
    return out;
}

} // namespace fixtures
} // namespace pvperf
