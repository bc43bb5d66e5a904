/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "decode/timestamp.h"
#include "decode/value.h"

#include <string>
#include <string_view>

namespace tagnorm::decode {

// Strips the whitespace code points Python's str.strip() removes.
std::string_view trim_view(std::string_view s);
std::string lower_copy(std::string_view s);

// "007" -> "7", "-007" -> "-7"; a lone zero (or one before '.') is kept.
std::string strip_leading_zeros(std::string_view s);

Outcome decode_string(std::string_view payload, TimeZoneMode time_zone);
Outcome decode_number(std::string_view payload);
Outcome decode_bool(std::string_view payload);
Outcome decode_null(std::string_view payload);

}  // namespace tagnorm::decode
