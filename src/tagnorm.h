/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "decode/typed_value_decoder.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace tagnorm {

// The input text is not valid JSON.
class InputError : public std::runtime_error {
   public:
    explicit InputError(const std::string& message) : std::runtime_error(message) {}
};

struct NormalizeOptions {
    decode::DecodeOptions decode{};
    int indent = 2;
    bool ensure_ascii = true;
};

struct NormalizeResult {
    nlohmann::ordered_json output = nlohmann::ordered_json::array();
    std::string text;
    std::size_t field_count = 0;
};

class TagNormalizer {
   public:
    static NormalizeResult
    NormalizeDocument(const nlohmann::ordered_json& document, const NormalizeOptions& opt = {});
    static NormalizeResult NormalizeText(std::string_view text, const NormalizeOptions& opt = {});
};

}  // namespace tagnorm
