#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace pvperf {

/// Untyped spreadsheet-like table, one entry per physical row.
/// Rows may have different widths; nothing is interpreted yet.
struct RawTable {
    std::string source_id;   ///< File identity used in error reports
    std::string sheet_name;  ///< Sheet the rows were taken from
    std::vector<std::vector<std::string>> rows;

    size_t row_count() const { return rows.size(); }

    /// Cell text, or an empty string when the row is shorter than col
    const std::string& cell(size_t row, size_t col) const;
};

} // namespace pvperf
