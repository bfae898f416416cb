/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace j2m::base64 {
/**
 * Decodes standard-alphabet, '='-padded base64. Only canonical input is
 * accepted: no whitespace, no URL-safe digits, and the unused low bits of
 * the last quantum must be zero, so encode(*decode_strict(s)) == s.
 */
std::optional<std::vector<std::uint8_t>> decode_strict(std::string_view s);

std::string encode(std::span<const std::uint8_t> bytes);
}  // namespace j2m::base64
