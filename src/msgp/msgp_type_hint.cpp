/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgp/msgp_type_hint.h"

#include "convert_error.h"

#include <array>
#include <utility>

namespace j2m::msgp {
namespace {
const std::array<std::pair<std::string_view, TypeTag>, 13> kTypeTagMap = {{
    {"byte", TypeTag::Byte},
    {"int8", TypeTag::Int8},
    {"int16", TypeTag::Int16},
    {"int32", TypeTag::Int32},
    {"int64", TypeTag::Int64},
    {"int", TypeTag::Int},
    {"uint8", TypeTag::Uint8},
    {"uint16", TypeTag::Uint16},
    {"uint32", TypeTag::Uint32},
    {"uint64", TypeTag::Uint64},
    {"uint", TypeTag::Uint},
    {"float32", TypeTag::Float32},
    {"float64", TypeTag::Float64},
}};

[[noreturn]] void throw_bad_hint(const std::string& key) {
    throw ConvertError(
        "Invalid type hint for key \"" + key
        + "\": expected a tag name or a non-empty array of tag names"
    );
}
}  // namespace

std::optional<TypeTag> parse_type_tag(std::string_view name) {
    for (const auto& [k, v] : kTypeTagMap) {
        if (k == name) {
            return v;
        }
    }
    return std::nullopt;
}

std::string_view type_tag_name(TypeTag tag) {
    for (const auto& [k, v] : kTypeTagMap) {
        if (v == tag) {
            return k;
        }
    }
    return {};
}

TypeHints type_hints_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConvertError("Type hints must be a JSON object");
    }
    TypeHints hints;
    for (const auto& kv : j.items()) {
        const std::string& key = kv.key();
        const auto& value = kv.value();
        std::vector<std::string> tags;
        if (value.is_string()) {
            tags.push_back(value.get<std::string>());
        } else if (value.is_array() && !value.empty()) {
            for (const auto& tag : value) {
                if (!tag.is_string()) {
                    throw_bad_hint(key);
                }
                tags.push_back(tag.get<std::string>());
            }
        } else {
            throw_bad_hint(key);
        }
        hints[key] = std::move(tags);
    }
    return hints;
}

void merge_type_hints(TypeHints& base, const TypeHints& overrides) {
    for (const auto& [key, tags] : overrides) {
        base[key] = tags;
    }
}

}  // namespace j2m::msgp
