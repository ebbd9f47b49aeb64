#pragma once

#include "pvperf/core/types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace pvperf {

/// Lenient datetime parsing for chronological ordering.
///
/// Accepted forms (time part optional, seconds optional, fractional
/// seconds ignored):
///   YYYY-MM-DD HH:MM:SS   YYYY-MM-DDTHH:MM:SS   YYYY/MM/DD HH:MM:SS
///   MM/DD/YYYY HH:MM:SS   MM-DD-YYYY HH:MM:SS
/// A date with the year last is read month first, as spreadsheet exports
/// are usually read; day_first reads it as DD/MM/YYYY. When the preferred
/// order is not a valid date the other order is used.
/// Returns seconds since 1970-01-01 (UTC calendar), or nothing when the
/// text is not a valid date.
std::optional<int64_t> parse_timestamp(const std::string& text, bool day_first = false);

/// Stable chronological copy of the rows; unparseable timestamps go last
/// in their original order.
std::vector<PRRow> sort_by_time(const std::vector<PRRow>& rows, bool day_first = false);

} // namespace pvperf
