#include "pvperf/data/raw_table.hpp"

namespace pvperf {

const std::string& RawTable::cell(size_t row, size_t col) const {
    static const std::string empty;
    if (row >= rows.size() || col >= rows[row].size()) {
        return empty;
    }
    return rows[row][col];
}

} // namespace pvperf
