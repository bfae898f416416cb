/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "convert_error.h"
#include "msgp/msgp_type_hint.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string_view>
#include <vector>

namespace j2m {

using msgp::TypeHints;

struct ConvertOptions {
    // Fail when a hinted number does not fit its hinted type instead of
    // narrowing it.
    bool strict_hints = false;
    bool debug = false;
};

class Json2Msgp {
   public:
    /**
     * Converts a JSON value to MessagePack. Throws ConvertError (or one of
     * its subclasses) on the first value that cannot be encoded; nothing is
     * returned in that case.
     */
    static std::vector<std::uint8_t>
    Convert(const nlohmann::json& value, const TypeHints& hints = {}, const ConvertOptions& opt = {});

    // A null pointer converts to nil.
    static std::vector<std::uint8_t>
    Convert(const nlohmann::json* value, const TypeHints& hints = {}, const ConvertOptions& opt = {});

    /**
     * Parses JSON text and turns every integer into a double, matching the
     * single number type of JSON itself. Throws ParseError.
     */
    static nlohmann::json ParseJson(std::string_view text);

    /**
     * Reads all of `in`, converts it and writes the result to `out` in one
     * write. Nothing is written if reading, parsing or encoding fails.
     */
    static void ConvertStream(
        std::istream& in,
        std::ostream& out,
        const TypeHints& hints = {},
        const ConvertOptions& opt = {},
        std::string_view label = {}
    );

    static TypeHints LoadTypeHints(const std::filesystem::path& path);
};

}  // namespace j2m
