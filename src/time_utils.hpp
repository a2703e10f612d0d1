#pragma once

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and utilities for UTC nanosecond bar timestamps
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr uint64_t NS_PER_SEC  = 1'000'000'000ULL;
constexpr uint64_t NS_PER_MIN  = 60ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_HOUR = 3600ULL * NS_PER_SEC;
constexpr uint64_t NS_PER_DAY  = 24ULL * NS_PER_HOUR;

// Days since 1970-01-01 for a proleptic Gregorian date (Hinnant's days_from_civil).
inline int64_t days_from_civil(int y, int m, int d) {
    y -= (m <= 2) ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline void civil_from_days(int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

// YYYYMMDD integer date → UTC midnight in nanoseconds.
inline uint64_t date_to_ns(int date) {
    int y = date / 10000, m = (date / 100) % 100, d = date % 100;
    int64_t days = days_from_civil(y, m, d);
    if (days < 0) {
        throw std::invalid_argument("Date before 1970-01-01: " + std::to_string(date));
    }
    return static_cast<uint64_t>(days) * NS_PER_DAY;
}

// UTC nanoseconds → YYYYMMDD integer date.
inline int ns_to_date(uint64_t ts) {
    int y = 0, m = 0, d = 0;
    civil_from_days(static_cast<int64_t>(ts / NS_PER_DAY), y, m, d);
    return y * 10000 + m * 100 + d;
}

inline std::string format_date(uint64_t ts) {
    int date = ns_to_date(ts);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  date / 10000, (date / 100) % 100, date % 100);
    return buf;
}

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" (or 'T' separator) or a
// non-negative integer count of epoch nanoseconds. Impossible calendar dates
// and out-of-range clock fields are rejected, never normalized.
inline uint64_t parse_timestamp(const std::string& text) {
    if (text.size() >= 10 && text[4] == '-' && text[7] == '-') {
        int y = 0, m = 0, d = 0;
        int consumed = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &y, &m, &d, &consumed) != 3 ||
            consumed != 10 || m < 1 || m > 12 || d < 1 || d > 31) {
            throw std::invalid_argument("Malformed date: " + text);
        }
        int cy = 0, cm = 0, cd = 0;
        civil_from_days(days_from_civil(y, m, d), cy, cm, cd);
        if (cy != y || cm != m || cd != d) {
            throw std::invalid_argument("No such calendar date: " + text);
        }
        uint64_t ts = date_to_ns(y * 10000 + m * 100 + d);
        if (text.size() == 10) return ts;

        int hh = 0, mm = 0, ss = 0;
        consumed = 0;
        if (text.size() != 19 || (text[10] != ' ' && text[10] != 'T') ||
            std::sscanf(text.c_str() + 11, "%2d:%2d:%2d%n", &hh, &mm, &ss, &consumed) != 3 ||
            consumed != 8 || hh < 0 || hh > 23 || mm < 0 || mm > 59 || ss < 0 || ss > 59) {
            throw std::invalid_argument("Malformed time of day: " + text);
        }
        return ts + static_cast<uint64_t>(hh) * NS_PER_HOUR +
               static_cast<uint64_t>(mm) * NS_PER_MIN + static_cast<uint64_t>(ss) * NS_PER_SEC;
    }
    // stoull accepts a sign and leading blanks; a timestamp has neither.
    if (text.empty() || text[0] < '0' || text[0] > '9') {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }
    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }
    return static_cast<uint64_t>(value);
}

}  // namespace time_utils
