/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace j2m::hash_utils {
std::array<std::uint8_t, 32> blake3_hash32(std::span<const std::uint8_t> payload);
std::string to_hex(std::span<const std::uint8_t> bytes);
}  // namespace j2m::hash_utils
