/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgp/msgp_numeric_resolver.h"

#include "convert_error.h"

#include <cmath>
#include <limits>

namespace j2m::msgp {
namespace {
constexpr double k2Pow63 = 9223372036854775808.0;
constexpr double k2Pow64 = 18446744073709551616.0;

bool is_integral(double v) {
    return std::isfinite(v) && std::trunc(v) == v;
}

bool in_range(double v, double lo, double hi) {
    return v >= lo && v <= hi;
}

bool fits_hint(TypeTag tag, double v) {
    switch (tag) {
        case TypeTag::Float64:
            return true;
        case TypeTag::Float32:
            return !std::isfinite(v)
                   || std::fabs(v) <= static_cast<double>(std::numeric_limits<float>::max());
        default:
            break;
    }
    if (!is_integral(v)) {
        return false;
    }
    switch (tag) {
        case TypeTag::Int8:
            return in_range(v, -128.0, 127.0);
        case TypeTag::Int16:
            return in_range(v, -32768.0, 32767.0);
        case TypeTag::Int32:
            return in_range(v, -2147483648.0, 2147483647.0);
        case TypeTag::Int64:
        case TypeTag::Int:
            return v >= -k2Pow63 && v < k2Pow63;
        case TypeTag::Byte:
        case TypeTag::Uint8:
            return in_range(v, 0.0, 255.0);
        case TypeTag::Uint16:
            return in_range(v, 0.0, 65535.0);
        case TypeTag::Uint32:
            return in_range(v, 0.0, 4294967295.0);
        case TypeTag::Uint64:
        case TypeTag::Uint:
            return v >= 0.0 && v < k2Pow64;
        default:
            return false;
    }
}

float narrow_to_float(double v) {
    if (std::isfinite(v) && std::fabs(v) > static_cast<double>(std::numeric_limits<float>::max())) {
        return v > 0 ? std::numeric_limits<float>::infinity()
                     : -std::numeric_limits<float>::infinity();
    }
    return static_cast<float>(v);
}

void write_hinted(MsgpWriter& out, TypeTag tag, double value) {
    const std::uint64_t bits = wrap_to_u64(value);
    switch (tag) {
        case TypeTag::Int8:
            out.write_int(static_cast<std::int8_t>(bits));
            return;
        case TypeTag::Int16:
            out.write_int(static_cast<std::int16_t>(bits));
            return;
        case TypeTag::Int32:
            out.write_int(static_cast<std::int32_t>(bits));
            return;
        case TypeTag::Int64:
        case TypeTag::Int:
            out.write_int(static_cast<std::int64_t>(bits));
            return;
        case TypeTag::Byte:
        case TypeTag::Uint8:
            out.write_uint(static_cast<std::uint8_t>(bits));
            return;
        case TypeTag::Uint16:
            out.write_uint(static_cast<std::uint16_t>(bits));
            return;
        case TypeTag::Uint32:
            out.write_uint(static_cast<std::uint32_t>(bits));
            return;
        case TypeTag::Uint64:
        case TypeTag::Uint:
            out.write_uint(bits);
            return;
        case TypeTag::Float32:
            out.write_float32(narrow_to_float(value));
            return;
        case TypeTag::Float64:
            out.write_float64(value);
            return;
    }
}
}  // namespace

const std::string* select_hint(const ConvertContext& ctx, const TypeHints& hints) {
    const auto it = hints.find(ctx.current_key);
    if (it == hints.end() || it->second.empty()) {
        return nullptr;
    }
    const auto& seq = it->second;
    return &seq[ctx.current_hint % seq.size()];
}

std::uint64_t wrap_to_u64(double value) {
    if (!std::isfinite(value)) {
        return 0;
    }
    const double t = std::trunc(value);
    if (t >= -k2Pow63 && t < k2Pow63) {
        return static_cast<std::uint64_t>(static_cast<std::int64_t>(t));
    }
    // |t| >= 2^63 is a multiple of 2^11, so fmod and the shift below are exact.
    double r = std::fmod(t, k2Pow64);
    if (r < 0) {
        r += k2Pow64;
    }
    return static_cast<std::uint64_t>(r);
}

void write_number(
    MsgpWriter& out,
    double value,
    const ConvertContext& ctx,
    const TypeHints& hints,
    const EncodeOptions& opt
) {
    if (const std::string* hint = select_hint(ctx, hints)) {
        const auto tag = parse_type_tag(*hint);
        if (!tag.has_value()) {
            throw UnsupportedTypeHint(ctx.current_key, *hint);
        }
        if (opt.strict_hints && !fits_hint(*tag, value)) {
            throw HintedValueOutOfRange(ctx.current_key, *hint, value);
        }
        write_hinted(out, *tag, value);
        return;
    }

    if (value >= -k2Pow63 && value < k2Pow63 && std::trunc(value) == value) {
        out.write_int(static_cast<std::int64_t>(value));
        return;
    }
    throw UnsupportedNumericValue(value);
}

}  // namespace j2m::msgp
