/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <string>

namespace j2m::msgp {

// Containers nested deeper than this are rejected.
inline constexpr std::size_t kMaxNestingDepth = 10000;

/**
 * Hint lookup state threaded through the document walk.
 *
 * current_key is the last object key seen anywhere in the walk, not the key
 * of the enclosing object. current_hint is the element position inside the
 * most recently entered array; it is reset on entry to every array and not
 * restored when a nested array ends, so only the innermost array's position
 * is reliable.
 */
struct ConvertContext {
    std::string current_key;
    std::size_t current_hint = 0;
};

struct EncodeOptions {
    // Reject hinted numbers the hinted type cannot represent.
    bool strict_hints = false;
};

}  // namespace j2m::msgp
