#include "pvperf/data/csv_table_reader.hpp"
#include <fstream>
#include <stdexcept>

namespace pvperf {

// ===== Public API =====

RawTable CsvTableReader::read(const std::string& path, const CsvReadOptions& opts) {
    // Open file
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    // Get file size (-1 for directories and other non-seekable paths)
    std::streamsize size = file.tellg();
    if (size < 0) {
        throw std::runtime_error("Failed to read file: " + path);
    }
    file.seekg(0, std::ios::beg);

    // Read file into memory
    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !file.read(buffer.data(), size)) {
        throw std::runtime_error("Failed to read file: " + path);
    }

    CsvReadOptions resolved = opts;
    if (resolved.source_id.empty()) {
        resolved.source_id = base_name(path);
    }
    return parse(buffer, resolved);
}

RawTable CsvTableReader::parse(const std::string& content, const CsvReadOptions& opts) {
    RawTable table;
    table.source_id = opts.source_id;
    table.sheet_name = opts.sheet_name;

    size_t pos = 0;

    // Skip UTF-8 byte order mark written by spreadsheet exports
    if (content.size() >= 3 &&
        static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        pos = 3;
    }

    // Collect physical records. A quoted field may span line breaks, so a
    // record ends at the first newline outside quotes. A quote opens a
    // quoted field only at the start of a field; elsewhere it is literal.
    std::string record;
    bool in_quotes = false;
    bool field_start = true;
    while (pos < content.size()) {
        char c = content[pos++];
        if (in_quotes) {
            if (c == '"') {
                if (pos < content.size() && content[pos] == '"') {
                    record += c;
                    record += content[pos++];
                    continue;
                }
                in_quotes = false;
            }
            record += c;
        } else if (c == '"' && field_start) {
            in_quotes = true;
            field_start = false;
            record += c;
        } else if (c == '\n') {
            table.rows.push_back(split_line(record, opts.delimiter));
            record.clear();
            field_start = true;
        } else {
            field_start = (c == opts.delimiter);
            record += c;
        }
    }

    // Last record without trailing newline
    if (!record.empty()) {
        table.rows.push_back(split_line(record, opts.delimiter));
    }

    return table;
}

// ===== Internal Methods =====

std::vector<std::string> CsvTableReader::split_line(const std::string& line, char delimiter) {
    std::vector<std::string> fields;

    // Empty physical line: keep the row, but with no cells
    if (line.empty() || line == "\r") {
        return fields;
    }

    std::string field;
    bool in_quotes = false;
    bool field_start = true;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (in_quotes) {
            if (c != '"') {
                field += c;
            } else if (i + 1 < line.size() && line[i + 1] == '"') {
                // Escaped quote inside a quoted field
                field += '"';
                ++i;
            } else {
                in_quotes = false;
            }
        } else if (c == '"' && field_start) {
            in_quotes = true;
            field_start = false;
        } else if (c == delimiter) {
            // Field separator
            fields.push_back(field);
            field.clear();
            field_start = true;
        } else if (c == '\r' && i + 1 == line.size()) {
            // CRLF line ending
            break;
        } else {
            // Stray quotes inside an unquoted field are kept as text
            field += c;
            field_start = false;
        }
    }

    // Add last field
    fields.push_back(field);

    return fields;
}

std::string CsvTableReader::base_name(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

} // namespace pvperf
