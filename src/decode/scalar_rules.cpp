/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "decode/scalar_rules.h"

#include <charconv>
#include <cstddef>
#include <cmath>
#include <cstdint>
#include <optional>
#include <system_error>

namespace tagnorm::decode {

// Code points str.isspace() accepts: the C0 separators 0x1C-0x1F and
// NEL, NBSP and the Unicode space separators on top of ASCII whitespace.
static bool is_space(char32_t cp) {
    if ((cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20)) {
        return true;
    }
    switch (cp) {
        case 0x85:
        case 0xA0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Decodes the UTF-8 sequence at the start of `s`. Returns its length, or 0
// when the bytes are not a well-formed sequence.
static std::size_t decode_utf8(std::string_view s, char32_t& cp) {
    if (s.empty()) {
        return 0;
    }
    const auto b0 = static_cast<unsigned char>(s[0]);
    std::size_t len = 0;
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    } else if ((b0 & 0xE0) == 0xC0) {
        cp = b0 & 0x1F;
        len = 2;
    } else if ((b0 & 0xF0) == 0xE0) {
        cp = b0 & 0x0F;
        len = 3;
    } else if ((b0 & 0xF8) == 0xF0) {
        cp = b0 & 0x07;
        len = 4;
    } else {
        return 0;
    }
    if (s.size() < len) {
        return 0;
    }
    for (std::size_t i = 1; i < len; i++) {
        const auto b = static_cast<unsigned char>(s[i]);
        if ((b & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    return len;
}

std::string_view trim_view(std::string_view s) {
    char32_t cp = 0;
    while (!s.empty()) {
        const std::size_t len = decode_utf8(s, cp);
        if (len == 0 || !is_space(cp)) {
            break;
        }
        s.remove_prefix(len);
    }
    while (!s.empty()) {
        // Walk back over at most three continuation bytes to the lead byte.
        std::size_t start = s.size() - 1;
        while (start > 0 && s.size() - start < 4
               && (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) {
            start--;
        }
        const std::size_t len = decode_utf8(s.substr(start), cp);
        if (len != s.size() - start || !is_space(cp)) {
            break;
        }
        s.remove_suffix(len);
    }
    return s;
}

std::string lower_copy(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (c >= 'A' && c <= 'Z') {
            out.push_back(static_cast<char>(c + 32));
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string strip_leading_zeros(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    if (!s.empty() && s.front() == '-') {
        out.push_back('-');
        s.remove_prefix(1);
    }
    while (s.size() >= 2 && s[0] == '0' && is_digit(s[1])) {
        s.remove_prefix(1);
    }
    out.append(s);
    return out;
}

// from_chars rejects a leading '+', so it is consumed here.
static std::string_view drop_plus_sign(std::string_view s, bool& ok) {
    ok = true;
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
        if (s.empty() || s.front() == '-' || s.front() == '+') {
            ok = false;
        }
    }
    return s;
}

static std::optional<std::int64_t> parse_integer(std::string_view s) {
    bool ok = false;
    s = drop_plus_sign(s, ok);
    if (!ok || s.empty()) {
        return std::nullopt;
    }
    std::int64_t v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

static std::optional<double> parse_decimal(std::string_view s) {
    bool ok = false;
    s = drop_plus_sign(s, ok);
    if (!ok || s.empty()) {
        return std::nullopt;
    }
    double v = 0.0;
    const auto [ptr, ec] =
        std::from_chars(s.data(), s.data() + s.size(), v, std::chars_format::general);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

Outcome decode_string(std::string_view payload, TimeZoneMode time_zone) {
    const auto value = trim_view(payload);
    if (value.empty()) {
        return Outcome::omit();
    }
    if (const auto civil = match_rfc3339_utc(value)) {
        if (const auto epoch = to_epoch_seconds(*civil, time_zone)) {
            return Outcome::present(Value(*epoch));
        }
    }
    return Outcome::present(Value(std::string(value)));
}

Outcome decode_number(std::string_view payload) {
    const std::string value = strip_leading_zeros(trim_view(payload));
    if (value.find('.') != std::string::npos) {
        if (const auto d = parse_decimal(value)) {
            return Outcome::present(Value(*d));
        }
        return Outcome::omit();
    }
    if (const auto i = parse_integer(value)) {
        return Outcome::present(Value(*i));
    }
    return Outcome::omit();
}

static bool is_true_literal(const std::string& s) {
    return s == "1" || s == "t" || s == "true";
}

static bool is_false_literal(const std::string& s) {
    return s == "0" || s == "f" || s == "false";
}

Outcome decode_bool(std::string_view payload) {
    const std::string value = lower_copy(trim_view(payload));
    if (is_true_literal(value)) {
        return Outcome::present(Value(true));
    }
    if (is_false_literal(value)) {
        return Outcome::present(Value(false));
    }
    return Outcome::omit();
}

Outcome decode_null(std::string_view payload) {
    const std::string value = lower_copy(trim_view(payload));
    if (is_true_literal(value)) {
        return Outcome::explicit_null();
    }
    return Outcome::omit();
}

}  // namespace tagnorm::decode
