/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tagnorm::decode {

// How a matched "...Z" timestamp is turned into epoch seconds.
// Local reproduces the observed reference output: the civil time is read
// in the process time zone even though the text carries a 'Z'.
enum class TimeZoneMode {
    Local,
    Utc,
};

struct CivilTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

// Strict YYYY-MM-DDTHH:MM:SSZ. No fractions, no offsets, no lowercase 't'/'z'.
std::optional<CivilTime> match_rfc3339_utc(std::string_view s);

std::optional<std::int64_t> to_epoch_seconds(const CivilTime& t, TimeZoneMode mode);

}  // namespace tagnorm::decode
