#pragma once

#include "bars/bar.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// bar_csv — OHLCV candles from CSV
//
// The header names the columns (any order, case-insensitive):
//   timestamp,open,high,low,close,volume
// "time", "date" and "datetime" are accepted for timestamp; volume is
// optional. Timestamps may be epoch seconds, epoch milliseconds or
// ISO-8601 ("2024-01-05 13:00:00", "2024-01-05T13:00:00Z",
// "2024-01-05T08:00:00-05:00"); an offset is converted to UTC.
// Rows must already be in timestamp order; validation rejects anything else.
// ---------------------------------------------------------------------------
namespace bar_csv {

// Epoch values below this are taken as seconds.
constexpr int64_t SECONDS_CUTOFF = 100000000000LL;

inline std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    std::stringstream ss(line);
    while (std::getline(ss, cell, ',')) {
        size_t b = 0;
        size_t e = cell.size();
        while (b < e && (std::isspace(static_cast<unsigned char>(cell[b])) || cell[b] == '"')) ++b;
        while (e > b && (std::isspace(static_cast<unsigned char>(cell[e - 1])) || cell[e - 1] == '"')) --e;
        cells.push_back(cell.substr(b, e - b));
    }
    if (!line.empty() && line.back() == ',') cells.emplace_back();
    return cells;
}

// Reads exactly two digits at p.
inline bool read_two_digits(const char*& p, int& out) {
    if (!std::isdigit(static_cast<unsigned char>(p[0])) ||
        !std::isdigit(static_cast<unsigned char>(p[1]))) {
        return false;
    }
    out = (p[0] - '0') * 10 + (p[1] - '0');
    p += 2;
    return true;
}

// Date, optional time, optional "Z" or +-HH[:MM] offset. Nothing may follow.
inline bool parse_iso8601(const std::string& s, int64_t& ts_ms) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    double sec = 0.0;
    int used = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &used) != 3) return false;
    const char* p = s.c_str() + used;

    if (*p == ' ' || *p == 'T') {
        ++p;
        if (!read_two_digits(p, h) || *p++ != ':' || !read_two_digits(p, mi)) return false;
        if (*p == ':') {
            ++p;
            if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
            char* end = nullptr;
            sec = std::strtod(p, &end);
            p = end;
        }
    }

    int64_t offset_ms = 0;
    if (*p == 'Z' || *p == 'z') {
        ++p;
    } else if (*p == '+' || *p == '-') {
        int sign = (*p == '-') ? -1 : 1;
        ++p;
        int oh = 0, om = 0;
        if (!read_two_digits(p, oh)) return false;
        if (*p == ':') ++p;
        if (*p != '\0' && !read_two_digits(p, om)) return false;
        if (oh > 14 || om > 59) return false;
        offset_ms = sign * (oh * time_utils::MS_PER_HOUR + om * time_utils::MS_PER_MIN);
    }
    if (*p != '\0') return false;

    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h < 0 || h > 23 || mi < 0 || mi > 59 ||
        sec < 0.0 || sec >= 61.0) {
        return false;
    }
    int64_t days = time_utils::days_from_civil(y, mo, d);
    ts_ms = days * time_utils::MS_PER_DAY + h * time_utils::MS_PER_HOUR +
            mi * time_utils::MS_PER_MIN +
            static_cast<int64_t>(std::llround(sec * 1000.0)) - offset_ms;
    return true;
}

inline int64_t parse_timestamp(const std::string& s) {
    if (s.empty()) throw DataValidationError("Empty timestamp");

    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (*end == '\0') {
        if (!std::isfinite(v)) throw DataValidationError("Bad timestamp: " + s);
        if (std::fabs(v) < static_cast<double>(SECONDS_CUTOFF)) {
            return static_cast<int64_t>(std::llround(v * 1000.0));
        }
        return static_cast<int64_t>(std::llround(v));
    }

    int64_t ts = 0;
    if (parse_iso8601(s, ts)) return ts;
    throw DataValidationError("Bad timestamp: " + s);
}

inline double parse_value(const std::string& s, const std::string& column, int line_no) {
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (s.empty() || *end != '\0') {
        throw DataValidationError("Line " + std::to_string(line_no) + ": bad " + column +
                                  " value '" + s + "'");
    }
    return v;
}

// Parse CSV text; throws DataValidationError on malformed input.
inline std::vector<Bar> parse(std::istream& in) {
    std::string line;
    int line_no = 0;
    std::map<std::string, int> col;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto cells = split_row(line);
        for (size_t i = 0; i < cells.size(); ++i) {
            std::string name = cells[i];
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (name == "time" || name == "date" || name == "datetime" || name == "open_time") {
                name = "timestamp";
            }
            col.emplace(name, static_cast<int>(i));
        }
        break;
    }

    for (const char* required : {"timestamp", "open", "high", "low", "close"}) {
        if (col.count(required) == 0) {
            throw DataValidationError(std::string("CSV header missing column: ") + required);
        }
    }
    bool has_volume = col.count("volume") > 0;

    std::vector<Bar> bars;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto cells = split_row(line);
        auto cell = [&](const char* name) -> const std::string& {
            size_t idx = static_cast<size_t>(col.at(name));
            if (idx >= cells.size()) {
                throw DataValidationError("Line " + std::to_string(line_no) +
                                          ": missing column " + name);
            }
            return cells[idx];
        };

        Bar b{};
        b.timestamp_ms = parse_timestamp(cell("timestamp"));
        b.open = parse_value(cell("open"), "open", line_no);
        b.high = parse_value(cell("high"), "high", line_no);
        b.low = parse_value(cell("low"), "low", line_no);
        b.close = parse_value(cell("close"), "close", line_no);
        b.volume = has_volume ? parse_value(cell("volume"), "volume", line_no) : 0.0;
        bars.push_back(b);
    }

    bar_util::validate_bars(bars);
    return bars;
}

inline std::vector<Bar> parse(const std::string& text) {
    std::istringstream in(text);
    return parse(in);
}

inline std::vector<Bar> load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open bar file: " + path);
    }
    return parse(file);
}

}  // namespace bar_csv
