/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "decode/tagged_value.h"

namespace tagnorm::decode {

Payload payload_of(const nlohmann::ordered_json& raw) {
    if (raw.is_string()) {
        return std::string_view(raw.get_ref<const std::string&>());
    }
    if (raw.is_array()) {
        return &raw.get_ref<const JsonArray&>();
    }
    if (raw.is_object()) {
        return &raw.get_ref<const JsonObject&>();
    }
    return UnsupportedPayload{};
}

std::optional<TaggedValue> classify(const nlohmann::ordered_json& node) {
    if (!node.is_object() || node.size() != 1) {
        return std::nullopt;
    }
    const auto it = node.begin();
    const auto tag = lookup_type_tag(it.key());
    if (!tag.has_value()) {
        return std::nullopt;
    }
    TaggedValue out{};
    out.tag = *tag;
    out.payload = payload_of(it.value());
    return out;
}

}  // namespace tagnorm::decode
