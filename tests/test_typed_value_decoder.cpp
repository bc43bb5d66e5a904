/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <catch2/catch_test_macros.hpp>

#include "decode/typed_value_decoder.h"
#include "tz_guard.h"

#include <string>
#include <vector>

using namespace tagnorm::decode;
using json = nlohmann::ordered_json;

static Outcome decode(const char* text, const DecodeOptions& opt = {}) {
    return decode_tagged(json::parse(text), opt);
}

static std::vector<std::string> keys_of(const Value& v) {
    std::vector<std::string> out;
    for (const auto& m : v.as_object()) {
        out.push_back(m.key);
    }
    return out;
}

TEST_CASE("decode_tagged dispatches scalar tags", "[decoder]") {
    REQUIRE(decode(R"({"S": " x "})").value() == Value("x"));
    REQUIRE(decode(R"({"N": "007"})").value() == Value(7));
    REQUIRE(decode(R"({"BOOL": "f"})").value() == Value(false));
    REQUIRE(decode(R"({"NULL": "true"})").is_explicit_null());
    REQUIRE(decode(R"({"NULL": "false"})").is_omit());
}

TEST_CASE("decode_tagged omits malformed wrappers and shape mismatches", "[decoder]") {
    SECTION("malformed wrappers") {
        REQUIRE(decode(R"({})").is_omit());
        REQUIRE(decode(R"({"S": "a", "N": "1"})").is_omit());
        REQUIRE(decode(R"({"B": "1"})").is_omit());
        REQUIRE(decode(R"("plain")").is_omit());
        REQUIRE(decode(R"(42)").is_omit());
    }

    SECTION("payload shape does not match the tag") {
        REQUIRE(decode(R"({"S": 5})").is_omit());
        REQUIRE(decode(R"({"N": 5})").is_omit());
        REQUIRE(decode(R"({"BOOL": true})").is_omit());
        REQUIRE(decode(R"({"NULL": null})").is_omit());
        REQUIRE(decode(R"({"S": ["a"]})").is_omit());
        REQUIRE(decode(R"({"L": "a"})").is_omit());
        REQUIRE(decode(R"({"L": {"S": "a"}})").is_omit());
        REQUIRE(decode(R"({"M": [{"S": "a"}]})").is_omit());
        REQUIRE(decode(R"({"M": "a"})").is_omit());
    }
}

TEST_CASE("L rule", "[decoder][list]") {
    SECTION("keeps S, N and BOOL elements in source order") {
        const auto o = decode(R"({"L": [
            {"S": " a "},
            {"NULL": "true"},
            {"N": "02"},
            {"M": {"x": {"S": "y"}}},
            {"L": [{"S": "nested"}]},
            {"BOOL": "T"},
            "junk",
            {"S": "x", "N": "1"},
            {"S": "   "},
            {"N": "nope"},
            {"N": "-1.5"}
        ]})");
        REQUIRE(o.is_present());
        const Value expected(Value::Array{Value("a"), Value(2), Value(true), Value(-1.5)});
        REQUIRE(o.value() == expected);
    }

    SECTION("empty after filtering is omitted") {
        REQUIRE(decode(R"({"L": []})").is_omit());
        REQUIRE(decode(R"({"L": [{"NULL": "1"}, {"S": ""}, {"L": []}]})").is_omit());
    }

    SECTION("element timestamps are converted") {
        TzGuard tz("UTC0");
        const auto o = decode(R"({"L": [{"S": "1970-01-01T00:01:00Z"}]})");
        REQUIRE(o.value() == Value(Value::Array{Value(std::int64_t{60})}));
    }
}

TEST_CASE("M rule", "[decoder][map]") {
    SECTION("sorts keys and trims them") {
        const auto o = decode(R"({"M": {
            "b": {"N": "1"},
            " c ": {"NULL": "1"},
            "a": {"S": "x"},
            "B": {"BOOL": "0"}
        }})");
        REQUIRE(o.is_present());
        REQUIRE(keys_of(o.value()) == std::vector<std::string>{"B", "a", "b", "c"});
        REQUIRE(o.value().find("c")->is_null());
        REQUIRE(*o.value().find("a") == Value("x"));
    }

    SECTION("drops omitted fields and blank keys") {
        const auto o = decode(R"({"M": {
            "keep": {"S": "v"},
            "blank": {"S": "  "},
            "   ": {"S": "no key"},
            "nulled": {"NULL": "f"},
            "bad": {"X": "1"}
        }})");
        REQUIRE(keys_of(o.value()) == std::vector<std::string>{"keep"});
    }

    SECTION("supports nested lists and maps") {
        const auto o = decode(R"({"M": {
            "list": {"L": [{"N": "1"}, {"N": "2"}]},
            "inner": {"M": {"z": {"BOOL": "true"}, "y": {"NULL": "true"}}}
        }})");
        REQUIRE(keys_of(o.value()) == std::vector<std::string>{"inner", "list"});
        const auto* inner = o.value().find("inner");
        REQUIRE(inner != nullptr);
        REQUIRE(keys_of(*inner) == std::vector<std::string>{"y", "z"});
        REQUIRE(inner->find("y")->is_null());
        REQUIRE(*o.value().find("list") == Value(Value::Array{Value(1), Value(2)}));
    }

    SECTION("an empty result collapses at the parent") {
        REQUIRE(decode(R"({"M": {}})").is_omit());
        REQUIRE(decode(R"({"M": {"inner": {"M": {"x": {"S": " "}}}}})").is_omit());
        const auto o = decode(R"({"M": {"inner": {"M": {"x": {"S": " "}}}, "k": {"N": "1"}}})");
        REQUIRE(keys_of(o.value()) == std::vector<std::string>{"k"});
    }

    SECTION("later field wins when trimmed keys collide") {
        const auto o = decode(R"({"M": {" k": {"N": "1"}, "k ": {"N": "2"}, "k": {"N": "bad"}}})");
        REQUIRE(*o.value().find("k") == Value(2));
    }
}

TEST_CASE("nesting deeper than max_depth is omitted", "[decoder][depth]") {
    const char* nested = R"({"M": {"a": {"M": {"b": {"S": "x"}}}}})";

    DecodeOptions shallow{};
    shallow.max_depth = 1;
    REQUIRE(decode(nested, shallow).is_omit());

    DecodeOptions deep{};
    deep.max_depth = 2;
    REQUIRE(decode(nested, deep).is_present());

    SECTION("adversarial depth does not recurse past the limit") {
        std::string text;
        const int levels = 5000;
        for (int i = 0; i < levels; i++) {
            text += R"({"M": {"k": )";
        }
        text += R"({"S": "leaf"})";
        for (int i = 0; i < levels; i++) {
            text += "}}";
        }
        REQUIRE(decode(text.c_str()).is_omit());
    }
}

TEST_CASE("decode_document", "[decoder][document]") {
    SECTION("sample document") {
        const auto doc = json::parse(
            R"({"a ": {"S": " hello "}, "n": {"N": "007"}, "z": {"NULL": "true"}, "empty": {"S": "   "}})"
        );
        const auto out = decode_document(doc);
        REQUIRE(out.size() == 1);
        const Value expected(Value::Object{
            {"a", Value("hello")},
            {"n", Value(7)},
            {"z", Value(nullptr)},
        });
        REQUIRE(out[0] == expected);
    }

    SECTION("empty document yields an empty sequence") {
        REQUIRE(decode_document(json::parse("{}")).empty());
        REQUIRE(decode_document(json::parse(R"({"x": {"S": ""}, "y": {"NULL": "0"}})")).empty());
    }

    SECTION("top-level keys keep their source order") {
        const auto out = decode_document(json::parse(R"({"b": {"S": "1"}, "a": {"S": "2"}})"));
        REQUIRE(keys_of(out.at(0)) == std::vector<std::string>{"b", "a"});
    }

    SECTION("trimmed key collision replaces the value in place") {
        const auto out = decode_document(json::parse(
            R"({"k": {"N": "1"}, "m": {"N": "3"}, "k ": {"N": "2"}, " m": {"N": "x"}})"
        ));
        REQUIRE(keys_of(out.at(0)) == std::vector<std::string>{"k", "m"});
        REQUIRE(*out[0].find("k") == Value(2));
        REQUIRE(*out[0].find("m") == Value(3));
    }

    SECTION("non-object root is a document error") {
        REQUIRE_THROWS_AS(decode_document(json::parse("[]")), DocumentError);
        REQUIRE_THROWS_AS(decode_document(json::parse("\"text\"")), DocumentError);
        REQUIRE_THROWS_AS(decode_document(json::parse("null")), DocumentError);
    }

    SECTION("decoding is deterministic") {
        const auto doc = json::parse(
            R"({"m": {"M": {"z": {"N": "1.25"}, "a": {"L": [{"S": "q"}, {"BOOL": "1"}]}}}, "s": {"S": "v"}})"
        );
        REQUIRE(decode_document(doc) == decode_document(doc));
    }
}
