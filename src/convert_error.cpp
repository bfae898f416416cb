/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "convert_error.h"

#include <array>
#include <charconv>

namespace j2m {
std::string format_number(double value) {
    std::array<char, 32> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (res.ec != std::errc()) {
        return "<unprintable>";
    }
    return std::string(buf.data(), res.ptr);
}
}  // namespace j2m
