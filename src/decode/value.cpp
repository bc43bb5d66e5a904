/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "decode/value.h"

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace tagnorm::decode {

Value::Value() : data_(nullptr) {}
Value::Value(std::nullptr_t) : data_(nullptr) {}
Value::Value(bool v) : data_(v) {}
Value::Value(int v) : data_(static_cast<std::int64_t>(v)) {}
Value::Value(std::int64_t v) : data_(v) {}
Value::Value(double v) : data_(v) {}
Value::Value(const char* v) : data_(std::string(v)) {}
Value::Value(std::string v) : data_(std::move(v)) {}
Value::Value(Array v) : data_(std::move(v)) {}
Value::Value(Object v) : data_(std::move(v)) {}

const Value::Array& Value::as_array() const {
    return std::get<Array>(data_);
}

const Value::Object& Value::as_object() const {
    return std::get<Object>(data_);
}

const Value* Value::find(std::string_view key) const {
    const auto* obj = std::get_if<Object>(&data_);
    if (!obj) {
        return nullptr;
    }
    for (const auto& m : *obj) {
        if (m.key == key) {
            return &m.value;
        }
    }
    return nullptr;
}

bool operator==(const Value& a, const Value& b) {
    return a.storage() == b.storage();
}

bool operator==(const Member& a, const Member& b) {
    return a.key == b.key && a.value == b.value;
}

Outcome::Outcome(Kind kind, std::optional<Value> value) : kind_(kind), value_(std::move(value)) {}

Outcome Outcome::omit() {
    return Outcome(Kind::Omit, std::nullopt);
}

Outcome Outcome::explicit_null() {
    return Outcome(Kind::ExplicitNull, Value(nullptr));
}

Outcome Outcome::present(Value v) {
    return Outcome(Kind::Present, std::move(v));
}

std::optional<Value> Outcome::take() && {
    return std::move(value_);
}

const Value& Outcome::value() const {
    if (!value_.has_value()) {
        throw std::logic_error("Outcome::value() called on an omitted field");
    }
    return *value_;
}

nlohmann::ordered_json to_json(const Value& value) {
    return std::visit(
        [](const auto& v) -> nlohmann::ordered_json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Value::Array>) {
                auto out = nlohmann::ordered_json::array();
                for (const auto& el : v) {
                    out.push_back(to_json(el));
                }
                return out;
            } else if constexpr (std::is_same_v<T, Value::Object>) {
                auto out = nlohmann::ordered_json::object();
                for (const auto& m : v) {
                    out[m.key] = to_json(m.value);
                }
                return out;
            } else {
                return nlohmann::ordered_json(v);
            }
        },
        value.storage()
    );
}

}  // namespace tagnorm::decode
