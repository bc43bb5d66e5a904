/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "decode/typed_value_decoder.h"

#include "decode/scalar_rules.h"

#include <map>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace tagnorm::decode {

static Outcome decode_scalar(const TaggedValue& tv, const DecodeOptions& opt) {
    const auto* text = std::get_if<std::string_view>(&tv.payload);
    if (!text) {
        return Outcome::omit();
    }
    switch (tv.tag) {
        case TypeTag::String:
            return decode_string(*text, opt.time_zone);
        case TypeTag::Number:
            return decode_number(*text);
        case TypeTag::Bool:
            return decode_bool(*text);
        case TypeTag::Null:
            return decode_null(*text);
        case TypeTag::List:
        case TypeTag::Map:
            break;
    }
    return Outcome::omit();
}

Outcome decode_value(const TaggedValue& tv, const DecodeOptions& opt, std::size_t depth) {
    switch (tv.tag) {
        case TypeTag::List:
            if (depth >= opt.max_depth) {
                return Outcome::omit();
            }
            return decode_list(tv.payload, opt);
        case TypeTag::Map:
            if (depth >= opt.max_depth) {
                return Outcome::omit();
            }
            return decode_map(tv.payload, opt, depth + 1);
        default:
            return decode_scalar(tv, opt);
    }
}

Outcome decode_tagged(const nlohmann::ordered_json& node, const DecodeOptions& opt, std::size_t depth) {
    const auto tv = classify(node);
    if (!tv.has_value()) {
        return Outcome::omit();
    }
    return decode_value(*tv, opt, depth);
}

Outcome decode_list(const Payload& payload, const DecodeOptions& opt) {
    const auto* items = std::get_if<const JsonArray*>(&payload);
    if (!items) {
        return Outcome::omit();
    }
    Value::Array out;
    out.reserve((*items)->size());
    for (const auto& item : **items) {
        const auto tv = classify(item);
        if (!tv.has_value() || !is_list_element_tag(tv->tag)) {
            continue;
        }
        auto decoded = std::move(decode_scalar(*tv, opt)).take();
        if (decoded.has_value()) {
            out.push_back(std::move(*decoded));
        }
    }
    if (out.empty()) {
        return Outcome::omit();
    }
    return Outcome::present(Value(std::move(out)));
}

// Shared per-field handling for M payloads and the document root.
// Returns false when the field is dropped.
static bool decode_field(
    const std::string& raw_key,
    const nlohmann::ordered_json& item,
    const DecodeOptions& opt,
    std::size_t depth,
    Member& out
) {
    const auto key = trim_view(raw_key);
    if (key.empty()) {
        return false;
    }
    auto decoded = std::move(decode_tagged(item, opt, depth)).take();
    if (!decoded.has_value()) {
        return false;
    }
    out.key = std::string(key);
    out.value = std::move(*decoded);
    return true;
}

Outcome decode_map(const Payload& payload, const DecodeOptions& opt, std::size_t depth) {
    const auto* fields = std::get_if<const JsonObject*>(&payload);
    if (!fields) {
        return Outcome::omit();
    }
    // Later fields win when two raw keys trim to the same key.
    std::map<std::string, Value> sorted;
    for (const auto& [raw_key, item] : **fields) {
        Member m;
        if (decode_field(raw_key, item, opt, depth, m)) {
            sorted.insert_or_assign(std::move(m.key), std::move(m.value));
        }
    }
    if (sorted.empty()) {
        return Outcome::omit();
    }
    Value::Object out;
    out.reserve(sorted.size());
    for (auto& [key, value] : sorted) {
        out.push_back(Member{key, std::move(value)});
    }
    return Outcome::present(Value(std::move(out)));
}

Value::Array decode_document(const nlohmann::ordered_json& root, const DecodeOptions& opt) {
    if (!root.is_object()) {
        throw DocumentError(
            std::string("Top-level JSON value must be an object, got ") + root.type_name()
        );
    }
    Value::Object fields;
    std::unordered_map<std::string, std::size_t> index;
    for (const auto& [raw_key, item] : root.get_ref<const JsonObject&>()) {
        Member m;
        if (!decode_field(raw_key, item, opt, 0, m)) {
            continue;
        }
        const auto it = index.find(m.key);
        if (it != index.end()) {
            fields[it->second].value = std::move(m.value);
            continue;
        }
        index.emplace(m.key, fields.size());
        fields.push_back(std::move(m));
    }
    Value::Array out;
    if (!fields.empty()) {
        out.emplace_back(std::move(fields));
    }
    return out;
}

}  // namespace tagnorm::decode
