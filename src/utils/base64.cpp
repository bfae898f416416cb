/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "base64.h"

namespace j2m::base64 {
namespace {
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int digit_value(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+') {
        return 62;
    }
    if (c == '/') {
        return 63;
    }
    return -1;
}
}  // namespace

std::optional<std::vector<std::uint8_t>> decode_strict(std::string_view s) {
    if (s.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out;
    out.reserve(s.size() / 4 * 3);
    for (std::size_t pos = 0; pos < s.size(); pos += 4) {
        const bool last = pos + 4 == s.size();
        std::uint32_t value = 0;
        int pad = 0;
        for (int k = 0; k < 4; k++) {
            const char c = s[pos + static_cast<std::size_t>(k)];
            value <<= 6;
            if (c == '=') {
                // Padding only in the last two slots of the final quantum.
                if (!last || k < 2) {
                    return std::nullopt;
                }
                pad++;
                continue;
            }
            if (pad != 0) {
                return std::nullopt;
            }
            const int d = digit_value(c);
            if (d < 0) {
                return std::nullopt;
            }
            value |= static_cast<std::uint32_t>(d);
        }

        if (pad == 2 && (value & 0xFFFFu) != 0) {
            return std::nullopt;
        }
        if (pad == 1 && (value & 0xFFu) != 0) {
            return std::nullopt;
        }

        out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
        if (pad < 2) {
            out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
        }
        if (pad < 1) {
            out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
        }
    }
    return out;
}

std::string encode(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 16)
                                | (static_cast<std::uint32_t>(bytes[i + 1]) << 8)
                                | static_cast<std::uint32_t>(bytes[i + 2]);
        out.push_back(kAlphabet[(v >> 18) & 0x3Fu]);
        out.push_back(kAlphabet[(v >> 12) & 0x3Fu]);
        out.push_back(kAlphabet[(v >> 6) & 0x3Fu]);
        out.push_back(kAlphabet[v & 0x3Fu]);
    }
    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t v = static_cast<std::uint32_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(v >> 18) & 0x3Fu]);
        out.push_back(kAlphabet[(v >> 12) & 0x3Fu]);
        out.append("==");
    } else if (rest == 2) {
        const std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 16)
                                | (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(v >> 18) & 0x3Fu]);
        out.push_back(kAlphabet[(v >> 12) & 0x3Fu]);
        out.push_back(kAlphabet[(v >> 6) & 0x3Fu]);
        out.push_back('=');
    }
    return out;
}
}  // namespace j2m::base64
