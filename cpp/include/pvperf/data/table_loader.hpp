#pragma once

#include "pvperf/core/config.hpp"
#include "pvperf/core/types.hpp"
#include "pvperf/data/raw_table.hpp"
#include <string>
#include <cstddef>

namespace pvperf {

/// Bookkeeping of one load: what was kept and why rows were dropped
struct LoadStats {
    std::string source_id;
    SourceRole role = SourceRole::IRRADIANCE;
    std::string timestamp_header;   ///< Header cell of the timestamp column
    std::string value_header;       ///< Header cell of the value column
    size_t data_rows = 0;           ///< Physical rows after the header
    size_t kept_rows = 0;
    size_t non_numeric_rows = 0;    ///< Value missing or not a number
    size_t negative_rows = 0;       ///< Value below zero
    size_t missing_timestamp_rows = 0;

    size_t dropped_rows() const {
        return non_numeric_rows + negative_rows + missing_timestamp_rows;
    }
};

/// Tabular Loader - maps a raw export onto the canonical (timestamp, value) schema
class TableLoader {
public:
    TableLoader() = delete;  // Static class, no instances

    /// Load one table using the fixed layout of its role.
    /// Throws MalformedInputError when the sheet is absent, the table has
    /// no data rows, or the header row is too short.
    static TimeSeries load(const RawTable& table, SourceRole role);

    /// Load with an explicit layout; stats (optional) receives drop counts
    static TimeSeries load(
        const RawTable& table,
        SourceRole role,
        const ColumnMap& column_map,
        LoadStats* stats = nullptr
    );

    /// Parse a complete decimal number, rejecting NaN and infinities
    static bool try_parse_value(const std::string& text, double& out);

private:
    /// Strip surrounding whitespace
    static std::string trim(const std::string& text);
};

} // namespace pvperf
