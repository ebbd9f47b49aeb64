#include "pvperf/data/table_loader.hpp"
#include "pvperf/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace pvperf {

// ===== Public API =====

TimeSeries TableLoader::load(const RawTable& table, SourceRole role) {
    return load(table, role, ColumnMap::for_role(role));
}

TimeSeries TableLoader::load(
    const RawTable& table,
    SourceRole role,
    const ColumnMap& column_map,
    LoadStats* stats
) {
    // Expected sheet
    if (!column_map.sheet_name.empty() && table.sheet_name != column_map.sheet_name) {
        throw MalformedInputError(table.source_id, role,
            "sheet '" + column_map.sheet_name + "' not found (got '" + table.sheet_name + "')");
    }

    // Metadata rows, header row and at least one data row
    const size_t min_rows = std::max(column_map.header_row, column_map.first_data_row) + 1;
    if (table.row_count() < min_rows) {
        throw MalformedInputError(table.source_id, role,
            "expected at least " + std::to_string(min_rows) + " rows, found " +
            std::to_string(table.row_count()));
    }

    // Header must reach both mapped columns
    const auto& header = table.rows[column_map.header_row];
    const size_t needed_cols = std::max(column_map.timestamp_column, column_map.value_column) + 1;
    if (header.size() < needed_cols) {
        throw MalformedInputError(table.source_id, role,
            "header row " + std::to_string(column_map.header_row) + " has " +
            std::to_string(header.size()) + " columns, expected at least " +
            std::to_string(needed_cols));
    }

    LoadStats local;
    local.source_id = table.source_id;
    local.role = role;
    local.timestamp_header = trim(header[column_map.timestamp_column]);
    local.value_header = trim(header[column_map.value_column]);

    TimeSeries series;
    series.reserve(table.row_count() - column_map.first_data_row);

    for (size_t r = column_map.first_data_row; r < table.row_count(); ++r) {
        ++local.data_rows;

        double value;
        if (!try_parse_value(table.cell(r, column_map.value_column), value)) {
            ++local.non_numeric_rows;
            continue;
        }
        if (value < 0.0) {
            ++local.negative_rows;
            continue;
        }

        std::string ts = trim(table.cell(r, column_map.timestamp_column));
        if (ts.empty()) {
            ++local.missing_timestamp_rows;
            continue;
        }

        series.push_back(TimeSeriesRow{std::move(ts), value});
    }

    local.kept_rows = series.size();

    std::cout << "[LOAD] " << table.source_id << " (" << role_to_string(role) << "): kept "
              << local.kept_rows << " of " << local.data_rows << " rows";
    if (local.dropped_rows() > 0) {
        std::cout << " (" << local.non_numeric_rows << " non-numeric, "
                  << local.negative_rows << " negative, "
                  << local.missing_timestamp_rows << " without timestamp)";
    }
    std::cout << std::endl;

    if (stats) {
        *stats = std::move(local);
    }

    return series;
}

bool TableLoader::try_parse_value(const std::string& text, double& out) {
    const std::string str = trim(text);
    if (str.empty()) {
        return false;
    }

    try {
        size_t pos;
        out = std::stod(str, &pos);
        // Entire cell must be the number, and it must be a real value
        return pos == str.size() && std::isfinite(out);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// ===== Internal Methods =====

std::string TableLoader::trim(const std::string& text) {
    const size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace pvperf
