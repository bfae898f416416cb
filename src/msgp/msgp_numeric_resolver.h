/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "msgp/msgp_context.h"
#include "msgp/msgp_type_hint.h"
#include "msgp/msgp_writer.h"

#include <cstdint>
#include <string>

namespace j2m::msgp {

// Tag for the current number, or nullptr when no non-empty hint applies.
const std::string* select_hint(const ConvertContext& ctx, const TypeHints& hints);

/**
 * Truncates toward zero and reduces modulo 2^64. NaN and infinities give 0.
 * This is the narrowing used for hinted integer tags; callers cast the
 * result down to the hinted width.
 */
std::uint64_t wrap_to_u64(double value);

/**
 * Writes a JSON number. With a hint the value is cast to the hinted type
 * without a range check (unless opt.strict_hints); without one it must be
 * an exact 64-bit signed integer.
 *
 * Throws UnsupportedTypeHint, UnsupportedNumericValue or
 * HintedValueOutOfRange.
 */
void write_number(
    MsgpWriter& out,
    double value,
    const ConvertContext& ctx,
    const TypeHints& hints,
    const EncodeOptions& opt = {}
);

}  // namespace j2m::msgp
