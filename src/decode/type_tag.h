/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <optional>
#include <string_view>

namespace tagnorm::decode {

enum class TypeTag {
    String,
    Number,
    Bool,
    Null,
    List,
    Map,
};

// Exact, case-sensitive lookup of the wire spelling ("S", "N", "BOOL", ...).
std::optional<TypeTag> lookup_type_tag(std::string_view name);

// Lists only carry scalar elements; NULL, L and M elements are dropped.
bool is_list_element_tag(TypeTag tag);

}  // namespace tagnorm::decode
