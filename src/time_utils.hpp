#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and utilities for UTC epoch-millisecond timestamps
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr int64_t MS_PER_SEC  = 1000LL;
constexpr int64_t MS_PER_MIN  = 60LL * MS_PER_SEC;
constexpr int64_t MS_PER_HOUR = 60LL * MS_PER_MIN;
constexpr int64_t MS_PER_DAY  = 24LL * MS_PER_HOUR;

// 0 = Sunday ... 6 = Saturday (tm_wday convention).
constexpr int SUNDAY   = 0;
constexpr int FRIDAY   = 5;
constexpr int SATURDAY = 6;

// Floor division for negative timestamps (pre-1970).
inline int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

inline int64_t days_since_epoch(int64_t ts_ms) {
    return floor_div(ts_ms, MS_PER_DAY);
}

// 1970-01-01 was a Thursday.
inline int weekday_utc(int64_t ts_ms) {
    int64_t d = days_since_epoch(ts_ms);
    int64_t wd = (d + 4) % 7;
    if (wd < 0) wd += 7;
    return static_cast<int>(wd);
}

inline int hour_utc(int64_t ts_ms) {
    int64_t ms_of_day = ts_ms - days_since_epoch(ts_ms) * MS_PER_DAY;
    return static_cast<int>(ms_of_day / MS_PER_HOUR);
}

// Civil date from days since epoch (Howard Hinnant's algorithm).
inline void civil_from_days(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(y + (m <= 2 ? 1 : 0));
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

inline int64_t days_from_civil(int year, int month, int day) {
    int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

// YYYYMMDD
inline int date_int(int64_t ts_ms) {
    int y = 0, m = 0, d = 0;
    civil_from_days(days_since_epoch(ts_ms), y, m, d);
    return y * 10000 + m * 100 + d;
}

// YYYYMM
inline int month_int(int64_t ts_ms) {
    return date_int(ts_ms) / 100;
}

inline std::string weekday_name(int weekday) {
    static const char* NAMES[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    if (weekday < 0 || weekday > 6) return "?";
    return NAMES[weekday];
}

// ISO-8601 "YYYY-MM-DDTHH:MM:SSZ"
inline std::string to_iso8601(int64_t ts_ms) {
    int64_t days = days_since_epoch(ts_ms);
    int64_t ms_of_day = ts_ms - days * MS_PER_DAY;
    int y = 0, m = 0, d = 0;
    civil_from_days(days, y, m, d);
    int hh = static_cast<int>(ms_of_day / MS_PER_HOUR);
    int mm = static_cast<int>((ms_of_day % MS_PER_HOUR) / MS_PER_MIN);
    int ss = static_cast<int>((ms_of_day % MS_PER_MIN) / MS_PER_SEC);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", y, m, d, hh, mm, ss);
    return buf;
}

// ---------------------------------------------------------------------------
// Session — UTC trading session of the crypto day
// ---------------------------------------------------------------------------
enum class Session { ASIA, EUROPE, OVERLAP, US };

// asia 00-08 and 22-24, europe 08-14, overlap 14-16, us 16-22.
inline Session classify_session(int hour) {
    if (hour >= 14 && hour < 16) return Session::OVERLAP;
    if (hour >= 8 && hour < 14) return Session::EUROPE;
    if (hour >= 16 && hour < 22) return Session::US;
    return Session::ASIA;
}

inline std::string session_name(Session s) {
    switch (s) {
        case Session::ASIA:    return "asia";
        case Session::EUROPE:  return "europe";
        case Session::OVERLAP: return "overlap";
        case Session::US:      return "us";
    }
    return "unknown";
}

}  // namespace time_utils
