/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "hash_utils.h"

#include <blake3.h>

namespace j2m::hash_utils {
std::array<std::uint8_t, 32> blake3_hash32(std::span<const std::uint8_t> payload) {
    std::array<std::uint8_t, 32> out{};
    blake3_hasher h{};
    blake3_hasher_init(&h);
    if (!payload.empty()) {
        blake3_hasher_update(&h, payload.data(), payload.size());
    }
    blake3_hasher_finalize(&h, out.data(), out.size());
    return out;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}
}  // namespace j2m::hash_utils
