/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgp/msgp_encoder.h"

#include "convert_error.h"
#include "msgp/msgp_numeric_resolver.h"
#include "msgp/msgp_string_classifier.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace j2m::msgp {
namespace {

ConvertContext encode_array(
    MsgpWriter& out,
    const nlohmann::json& node,
    ConvertContext ctx,
    const EncodeEnv& env,
    std::size_t depth
) {
    out.write_array_header(node.size());
    // Not saved and restored around nested arrays.
    ctx.current_hint = 0;
    for (const auto& el : node) {
        ctx = encode_value(out, el, std::move(ctx), env, depth);
        ctx.current_hint++;
    }
    return ctx;
}

ConvertContext encode_object(
    MsgpWriter& out,
    const nlohmann::json& node,
    ConvertContext ctx,
    const EncodeEnv& env,
    std::size_t depth
) {
    std::vector<std::pair<const std::string*, const nlohmann::json*>> entries;
    entries.reserve(node.size());
    for (auto it = node.begin(); it != node.end(); ++it) {
        entries.emplace_back(&it.key(), &it.value());
    }
    // std::string ordering compares bytes as unsigned char.
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return *a.first < *b.first;
    });

    out.write_map_header(entries.size());
    for (const auto& [key, value] : entries) {
        out.write_string(*key);
        ctx.current_key = *key;
        ctx = encode_value(out, *value, std::move(ctx), env, depth);
    }
    return ctx;
}

}  // namespace

ConvertContext encode_value(
    MsgpWriter& out,
    const nlohmann::json& node,
    ConvertContext ctx,
    const EncodeEnv& env,
    std::size_t depth
) {
    using value_t = nlohmann::json::value_t;
    if (node.is_structured() && depth >= kMaxNestingDepth) {
        throw ConvertError(
            "Value nested deeper than " + std::to_string(kMaxNestingDepth) + " containers"
        );
    }
    switch (node.type()) {
        case value_t::null:
            out.write_nil();
            return ctx;
        case value_t::boolean:
            out.write_bool(node.get<bool>());
            return ctx;
        case value_t::number_float:
            write_number(out, node.get<double>(), ctx, env.hints, env.options);
            return ctx;
        case value_t::string:
            write_string_leaf(out, node.get_ref<const std::string&>());
            return ctx;
        case value_t::array:
            return encode_array(out, node, std::move(ctx), env, depth + 1);
        case value_t::object:
            return encode_object(out, node, std::move(ctx), env, depth + 1);
        case value_t::number_integer:
            out.write_int(node.get<std::int64_t>());
            return ctx;
        case value_t::number_unsigned:
            out.write_uint(node.get<std::uint64_t>());
            return ctx;
        case value_t::binary: {
            const auto& bin = node.get_binary();
            out.write_bytes(std::span<const std::uint8_t>(bin.data(), bin.size()));
            return ctx;
        }
        case value_t::discarded:
            throw ConvertError("Cannot encode a discarded JSON value");
    }
    throw ConvertError("Unknown JSON value type");
}

}  // namespace j2m::msgp
