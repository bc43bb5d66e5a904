/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace tagnorm::decode {

struct Member;

// Plain decoded value. Object members keep the order they were inserted in.
class Value {
   public:
    using Array = std::vector<Value>;
    using Object = std::vector<Member>;
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object>;

    Value();
    Value(std::nullptr_t);
    Value(bool v);
    Value(int v);
    Value(std::int64_t v);
    Value(double v);
    Value(const char* v);
    Value(std::string v);
    Value(Array v);
    Value(Object v);

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(data_); }
    bool is_bool() const { return std::holds_alternative<bool>(data_); }
    bool is_int() const { return std::holds_alternative<std::int64_t>(data_); }
    bool is_double() const { return std::holds_alternative<double>(data_); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_array() const { return std::holds_alternative<Array>(data_); }
    bool is_object() const { return std::holds_alternative<Object>(data_); }

    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
    double as_double() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Array& as_array() const;
    const Object& as_object() const;

    // Object lookup; nullptr when not an object or the key is missing.
    const Value* find(std::string_view key) const;

    const Storage& storage() const { return data_; }

   private:
    Storage data_;
};

struct Member {
    std::string key;
    Value value;
};

bool operator==(const Value& a, const Value& b);
bool operator==(const Member& a, const Member& b);

// Result of one decoding rule. Omit and ExplicitNull are kept apart:
// a NULL tag set to true keeps the field as null, anything else drops it.
class Outcome {
   public:
    enum class Kind {
        Omit,
        ExplicitNull,
        Present,
    };

    static Outcome omit();
    static Outcome explicit_null();
    static Outcome present(Value v);

    Kind kind() const { return kind_; }
    bool is_omit() const { return kind_ == Kind::Omit; }
    bool is_explicit_null() const { return kind_ == Kind::ExplicitNull; }
    bool is_present() const { return kind_ == Kind::Present; }

    // Omit has no value; ExplicitNull yields null.
    std::optional<Value> take() &&;
    const Value& value() const;

   private:
    Outcome(Kind kind, std::optional<Value> value);

    Kind kind_ = Kind::Omit;
    std::optional<Value> value_;
};

nlohmann::ordered_json to_json(const Value& value);

}  // namespace tagnorm::decode
