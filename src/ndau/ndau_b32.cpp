/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "ndau_b32.h"

#include <array>
#include <stdexcept>

namespace j2m::ndau {
namespace {
constexpr std::array<std::int8_t, 256> make_decode_table() {
    std::array<std::int8_t, 256> t{};
    for (auto& v : t) {
        v = -1;
    }
    for (std::size_t i = 0; i < kB32Alphabet.size(); i++) {
        t[static_cast<unsigned char>(kB32Alphabet[i])] = static_cast<std::int8_t>(i);
    }
    return t;
}

constexpr auto kDecodeTable = make_decode_table();
}  // namespace

std::string b32_encode(std::span<const std::uint8_t> bytes) {
    if (bytes.size() % 5 != 0) {
        throw std::invalid_argument("b32_encode input must be a multiple of 5 bytes");
    }
    std::string out;
    out.reserve(bytes.size() / 5 * 8);
    std::uint64_t acc = 0;
    int bits = 0;
    for (const auto b : bytes) {
        acc = (acc << 8) | b;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kB32Alphabet[static_cast<std::size_t>((acc >> bits) & 0x1Fu)]);
        }
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> b32_decode(std::string_view text) {
    if (text.size() % 8 != 0) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 8 * 5);
    std::uint64_t acc = 0;
    int bits = 0;
    for (const char c : text) {
        const std::int8_t v = kDecodeTable[static_cast<unsigned char>(c)];
        if (v < 0) {
            return std::nullopt;
        }
        acc = (acc << 5) | static_cast<std::uint64_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFFu));
        }
    }
    return out;
}
}  // namespace j2m::ndau
