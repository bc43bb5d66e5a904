/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "decode/timestamp.h"

#include <ctime>

namespace tagnorm::decode {

static bool read_digits(std::string_view s, std::size_t off, std::size_t count, int& out) {
    if (off + count > s.size()) {
        return false;
    }
    int v = 0;
    for (std::size_t i = 0; i < count; i++) {
        const char c = s[off + i];
        if (c < '0' || c > '9') {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

static bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static int days_in_month(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

std::optional<CivilTime> match_rfc3339_utc(std::string_view s) {
    // Field offsets: year 0, month 5, day 8, hour 11, minute 14, second 17.
    if (s.size() != 20) {
        return std::nullopt;
    }
    if (s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':' || s[19] != 'Z') {
        return std::nullopt;
    }
    CivilTime t{};
    if (!read_digits(s, 0, 4, t.year) || !read_digits(s, 5, 2, t.month)
        || !read_digits(s, 8, 2, t.day) || !read_digits(s, 11, 2, t.hour)
        || !read_digits(s, 14, 2, t.minute) || !read_digits(s, 17, 2, t.second)) {
        return std::nullopt;
    }
    if (t.year < 1 || t.month < 1 || t.month > 12) {
        return std::nullopt;
    }
    if (t.day < 1 || t.day > days_in_month(t.year, t.month)) {
        return std::nullopt;
    }
    if (t.hour > 23 || t.minute > 59 || t.second > 59) {
        return std::nullopt;
    }
    return t;
}

std::optional<std::int64_t> to_epoch_seconds(const CivilTime& t, TimeZoneMode mode) {
    std::tm tm{};
    tm.tm_year = t.year - 1900;
    tm.tm_mon = t.month - 1;
    tm.tm_mday = t.day;
    tm.tm_hour = t.hour;
    tm.tm_min = t.minute;
    tm.tm_sec = t.second;
    tm.tm_isdst = -1;
    // mktime/timegm normalize tm_wday on success; -1 can be a valid result.
    tm.tm_wday = -1;

    std::time_t epoch = 0;
    if (mode == TimeZoneMode::Local) {
        epoch = std::mktime(&tm);
    } else {
#if defined(_WIN32)
        epoch = ::_mkgmtime(&tm);
#else
        epoch = ::timegm(&tm);
#endif
    }
    if (epoch == static_cast<std::time_t>(-1) && tm.tm_wday == -1) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(epoch);
}

}  // namespace tagnorm::decode
