#pragma once

#include "pvperf/core/types.hpp"
#include <unordered_map>
#include <vector>
#include <cstddef>

namespace pvperf {

/// Hash index of row positions by timestamp, used for inner joins.
/// Positions of a key keep their input order.
class TimestampIndex {
private:
    std::unordered_map<Timestamp, std::vector<size_t>> positions_;

    static const std::vector<size_t>& empty_positions() {
        static const std::vector<size_t> none;
        return none;
    }

public:
    TimestampIndex() = default;

    /// Index any row sequence exposing a `timestamp` member
    template<typename Row>
    explicit TimestampIndex(const std::vector<Row>& rows) {
        positions_.reserve(rows.size());
        for (size_t i = 0; i < rows.size(); ++i) {
            positions_[rows[i].timestamp].push_back(i);
        }
    }

    /// Positions carrying this timestamp (empty when absent)
    const std::vector<size_t>& find(const Timestamp& ts) const {
        auto it = positions_.find(ts);
        if (it == positions_.end()) {
            return empty_positions();
        }
        return it->second;
    }

    size_t key_count() const { return positions_.size(); }
};

} // namespace pvperf
