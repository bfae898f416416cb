/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace j2m::msgp {

enum class TypeTag {
    Byte,
    Int8,
    Int16,
    Int32,
    Int64,
    Int,
    Uint8,
    Uint16,
    Uint32,
    Uint64,
    Uint,
    Float32,
    Float64,
};

/**
 * Field name (or "" for unnamed values inside arrays) to the tags used for
 * numbers found under it. The sequence is indexed by the array position
 * counter modulo its length.
 */
using TypeHints = std::map<std::string, std::vector<std::string>, std::less<>>;

std::optional<TypeTag> parse_type_tag(std::string_view name);
std::string_view type_tag_name(TypeTag tag);

/**
 * Builds a hint table from a JSON object. Each value is either a non-empty
 * array of tag names or a single tag name. Tag names are not checked here;
 * an unknown tag only fails when a number actually resolves to it.
 */
TypeHints type_hints_from_json(const nlohmann::json& j);

// Entries of `overrides` replace same-named entries of `base`.
void merge_type_hints(TypeHints& base, const TypeHints& overrides);

}  // namespace j2m::msgp
