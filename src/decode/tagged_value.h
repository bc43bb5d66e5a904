/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "decode/type_tag.h"

#include <optional>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace tagnorm::decode {

using JsonArray = nlohmann::ordered_json::array_t;
using JsonObject = nlohmann::ordered_json::object_t;

// Payload shape that no rule accepts (number, bool, null).
struct UnsupportedPayload {};

// Non-owning views into the parsed document; valid while the document lives.
using Payload = std::variant<UnsupportedPayload, std::string_view, const JsonArray*, const JsonObject*>;

struct TaggedValue {
    TypeTag tag = TypeTag::String;
    Payload payload;
};

/**
 * Interprets `node` as a single-entry {tag: payload} wrapper.
 * Returns nullopt for non-objects, objects with zero or several entries,
 * and unknown tags.
 */
std::optional<TaggedValue> classify(const nlohmann::ordered_json& node);

Payload payload_of(const nlohmann::ordered_json& raw);

}  // namespace tagnorm::decode
