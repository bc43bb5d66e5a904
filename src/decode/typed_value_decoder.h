/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "decode/tagged_value.h"
#include "decode/timestamp.h"
#include "decode/value.h"

#include <cstddef>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace tagnorm::decode {

struct DecodeOptions {
    TimeZoneMode time_zone = TimeZoneMode::Local;
    // L/M composites nested deeper than this are omitted.
    std::size_t max_depth = 512;
};

// The document root was not a JSON object.
class DocumentError : public std::runtime_error {
   public:
    explicit DocumentError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Decodes one {tag: payload} wrapper. Malformed wrappers, unknown tags,
 * payload shape mismatches and unparseable literals all yield Omit.
 * `depth` is the nesting level of the wrapper (0 for top-level fields).
 */
Outcome decode_tagged(const nlohmann::ordered_json& node, const DecodeOptions& opt, std::size_t depth = 0);

Outcome decode_value(const TaggedValue& tv, const DecodeOptions& opt, std::size_t depth);

// L payload: only S, N and BOOL elements survive; Omit when nothing does.
Outcome decode_list(const Payload& payload, const DecodeOptions& opt);

// M payload: keys trimmed, sorted ascending; Omit when nothing survives.
Outcome decode_map(const Payload& payload, const DecodeOptions& opt, std::size_t depth);

// Top-level object -> [] or [ {...} ]. Keys keep their first-seen order.
Value::Array decode_document(const nlohmann::ordered_json& root, const DecodeOptions& opt = {});

}  // namespace tagnorm::decode
