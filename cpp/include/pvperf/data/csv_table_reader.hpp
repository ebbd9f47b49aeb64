#pragma once

#include "pvperf/data/raw_table.hpp"
#include <string>
#include <vector>

namespace pvperf {

/// CSV reading options
struct CsvReadOptions {
    char delimiter = ',';               ///< Field delimiter
    std::string sheet_name = "5 minutes"; ///< Sheet name recorded on the table
    std::string source_id;              ///< Table identity (empty = file name)
};

/// CSV Reader - turns one exported sheet into a RawTable
class CsvTableReader {
public:
    CsvTableReader() = delete;  // Static class, no instances

    /// Read CSV file into RawTable
    static RawTable read(const std::string& path, const CsvReadOptions& opts);

    /// Parse CSV text already in memory
    static RawTable parse(const std::string& content, const CsvReadOptions& opts);

private:
    /// Split one record into fields (RFC 4180 quoting)
    static std::vector<std::string> split_line(
        const std::string& line,
        char delimiter
    );

    /// File name component of a path
    static std::string base_name(const std::string& path);
};

} // namespace pvperf
