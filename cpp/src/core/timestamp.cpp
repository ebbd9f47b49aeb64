#include "pvperf/core/timestamp.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace pvperf {

namespace {

/// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

/// Reads a run of digits starting at pos; returns digit count (0 = none)
size_t read_number(const std::string& s, size_t& pos, int64_t& out) {
    const size_t start = pos;
    out = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])) && pos - start < 9) {
        out = out * 10 + (s[pos] - '0');
        ++pos;
    }
    return pos - start;
}

bool valid_date(int64_t y, int64_t m, int64_t d) {
    return m >= 1 && m <= 12 && d >= 1 && d <= days_in_month(y, static_cast<unsigned>(m));
}

bool parse_date(const std::string& s, size_t& pos, bool day_first,
                int64_t& y, unsigned& m, unsigned& d) {
    int64_t a, b, c;
    const size_t len_a = read_number(s, pos, a);
    if (len_a == 0 || pos >= s.size()) return false;

    const char sep = s[pos];
    if (sep != '-' && sep != '/') return false;
    ++pos;

    if (read_number(s, pos, b) == 0) return false;
    if (pos >= s.size() || s[pos] != sep) return false;
    ++pos;

    const size_t len_c = read_number(s, pos, c);
    if (len_c == 0) return false;

    int64_t month, day;
    if (len_a == 4) {
        y = a; month = b; day = c;                          // Y-M-D
    } else if (len_c == 4) {
        // Year last: month first unless asked otherwise. The other order is
        // taken when the preferred one is not a valid date (13/01/2024).
        y = c;
        month = day_first ? b : a;
        day = day_first ? a : b;
        if (!valid_date(y, month, day)) {
            std::swap(month, day);
        }
    } else {
        return false;
    }

    if (!valid_date(y, month, day)) {
        return false;
    }
    m = static_cast<unsigned>(month);
    d = static_cast<unsigned>(day);
    return true;
}

bool parse_time(const std::string& s, size_t& pos, int64_t& seconds) {
    int64_t hh, mm, ss = 0;
    if (read_number(s, pos, hh) == 0) return false;
    if (pos >= s.size() || s[pos] != ':') return false;
    ++pos;
    if (read_number(s, pos, mm) == 0) return false;

    if (pos < s.size() && s[pos] == ':') {
        ++pos;
        if (read_number(s, pos, ss) == 0) return false;
        // Fractional seconds are ignored
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        }
    }

    if (hh > 23 || mm > 59 || ss > 60) return false;
    seconds = hh * 3600 + mm * 60 + ss;
    return true;
}

} // namespace

std::optional<int64_t> parse_timestamp(const std::string& text, bool day_first) {
    const size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const size_t last = text.find_last_not_of(" \t\r\n");
    std::string s = text.substr(first, last - first + 1);
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
    }

    size_t pos = 0;
    int64_t y;
    unsigned m, d;
    if (!parse_date(s, pos, day_first, y, m, d)) {
        return std::nullopt;
    }

    int64_t seconds = 0;
    if (pos < s.size()) {
        if (s[pos] != ' ' && s[pos] != 'T') {
            return std::nullopt;
        }
        while (pos < s.size() && (s[pos] == ' ' || s[pos] == 'T')) ++pos;
        if (!parse_time(s, pos, seconds)) {
            return std::nullopt;
        }
        if (pos != s.size()) {
            return std::nullopt;
        }
    }

    return days_from_civil(y, m, d) * 86400 + seconds;
}

std::vector<PRRow> sort_by_time(const std::vector<PRRow>& rows, bool day_first) {
    std::vector<std::pair<std::optional<int64_t>, size_t>> keys;
    keys.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        keys.emplace_back(parse_timestamp(rows[i].timestamp, day_first), i);
    }

    // Parsed times first, ascending; unparsed keep input order at the end
    std::stable_sort(keys.begin(), keys.end(), [](const auto& a, const auto& b) {
        if (a.first.has_value() != b.first.has_value()) {
            return a.first.has_value();
        }
        if (!a.first.has_value()) {
            return false;
        }
        return *a.first < *b.first;
    });

    std::vector<PRRow> sorted;
    sorted.reserve(rows.size());
    for (const auto& key : keys) {
        sorted.push_back(rows[key.second]);
    }
    return sorted;
}

} // namespace pvperf
