/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <string_view>

namespace j2m::utf8 {
// Rejects overlong forms, surrogate code points, values above U+10FFFF and
// truncated sequences.
bool is_valid(std::string_view s);
}  // namespace j2m::utf8
