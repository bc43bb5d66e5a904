/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tagnorm.h"

#include <algorithm>
#include <limits>

namespace tagnorm {

// A field wrapper at decode depth max_depth sits at JSON depth
// 2 * max_depth + 1; objects and arrays below it never reach the output.
static int parse_depth_limit(std::size_t max_depth) {
    const auto cap = static_cast<std::size_t>(std::numeric_limits<int>::max() - 1) / 2;
    return static_cast<int>(std::min(max_depth, cap)) * 2 + 1;
}

NormalizeResult
TagNormalizer::NormalizeDocument(const nlohmann::ordered_json& document, const NormalizeOptions& opt) {
    const auto decoded = decode::decode_document(document, opt.decode);

    NormalizeResult res{};
    for (const auto& v : decoded) {
        if (v.is_object()) {
            res.field_count += v.as_object().size();
        }
        res.output.push_back(decode::to_json(v));
    }
    res.text = res.output.dump(opt.indent, ' ', opt.ensure_ascii);
    return res;
}

NormalizeResult TagNormalizer::NormalizeText(std::string_view text, const NormalizeOptions& opt) {
    using event_t = nlohmann::ordered_json::parse_event_t;

    // Containers past the limit are discarded while parsing, so adversarial
    // nesting is never materialized (or copied) as a tree.
    const int limit = parse_depth_limit(opt.decode.max_depth);
    const nlohmann::ordered_json::parser_callback_t drop_deep =
        [limit](int depth, event_t event, nlohmann::ordered_json&) {
            if (event == event_t::object_start || event == event_t::array_start) {
                return depth <= limit;
            }
            return true;
        };

    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(text, drop_deep);
    } catch (const nlohmann::json::parse_error& e) {
        throw InputError(e.what());
    }
    return NormalizeDocument(document, opt);
}

}  // namespace tagnorm
