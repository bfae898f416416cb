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

namespace j2m::ndau {
// Lowercase alphabet without 'l', 'o', '0' and '1'.
inline constexpr std::string_view kB32Alphabet = "abcdefghijkmnpqrstuvwxyz23456789";

// Input length must be a multiple of 5 bytes; ndau text never carries padding.
std::string b32_encode(std::span<const std::uint8_t> bytes);

// Accepts whole 8-character groups only.
std::optional<std::vector<std::uint8_t>> b32_decode(std::string_view text);
}  // namespace j2m::ndau
