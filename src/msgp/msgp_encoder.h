/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "msgp/msgp_context.h"
#include "msgp/msgp_type_hint.h"
#include "msgp/msgp_writer.h"

#include <nlohmann/json.hpp>

#include <cstddef>

namespace j2m::msgp {

struct EncodeEnv {
    const TypeHints& hints;
    EncodeOptions options;
};

/**
 * Appends the MessagePack form of `node` and returns the context as it
 * stands afterwards. The returned context carries the last key seen and the
 * position counter of the last array entered, which the caller continues
 * with for the following siblings.
 *
 * number_float values go through the hint/heuristic resolver, strings
 * through the string classifier. number_integer, number_unsigned and binary
 * never come out of the JSON parser; they are written directly with no
 * hints or heuristics. Object keys are always written in byte order.
 *
 * `depth` is the number of containers enclosing `node`; a container that
 * would sit deeper than kMaxNestingDepth throws ConvertError.
 */
ConvertContext encode_value(
    MsgpWriter& out,
    const nlohmann::json& node,
    ConvertContext ctx,
    const EncodeEnv& env,
    std::size_t depth = 0
);

}  // namespace j2m::msgp
