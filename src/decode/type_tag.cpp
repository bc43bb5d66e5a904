/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "decode/type_tag.h"

#include <array>
#include <utility>

namespace tagnorm::decode {

static const std::array<std::pair<std::string_view, TypeTag>, 6> kTypeTagMap = {{
    {"S", TypeTag::String},
    {"N", TypeTag::Number},
    {"BOOL", TypeTag::Bool},
    {"NULL", TypeTag::Null},
    {"L", TypeTag::List},
    {"M", TypeTag::Map},
}};

std::optional<TypeTag> lookup_type_tag(std::string_view name) {
    for (const auto& [k, v] : kTypeTagMap) {
        if (k == name) {
            return v;
        }
    }
    return std::nullopt;
}

bool is_list_element_tag(TypeTag tag) {
    switch (tag) {
        case TypeTag::String:
        case TypeTag::Number:
        case TypeTag::Bool:
            return true;
        case TypeTag::Null:
        case TypeTag::List:
        case TypeTag::Map:
            return false;
    }
    return false;
}

}  // namespace tagnorm::decode
