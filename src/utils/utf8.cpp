/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "utf8.h"

#include <cstdint>

namespace j2m::utf8 {
namespace {
bool is_cont(unsigned char c) {
    return (c & 0xC0u) == 0x80u;
}
}  // namespace

bool is_valid(std::string_view s) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const auto* e = p + s.size();
    while (p < e) {
        const unsigned char c = *p++;
        if (c < 0x80u) {
            continue;
        }

        if ((c >> 5) == 0x6) {
            if (p >= e) {
                return false;
            }
            const unsigned char c1 = *p++;
            if (!is_cont(c1)) {
                return false;
            }
            if ((((c & 0x1Fu) << 6) | (c1 & 0x3Fu)) < 0x80u) {
                return false;
            }
            continue;
        }

        if ((c >> 4) == 0xE) {
            if (e - p < 2) {
                return false;
            }
            const unsigned char c1 = *p++;
            const unsigned char c2 = *p++;
            if (!is_cont(c1) || !is_cont(c2)) {
                return false;
            }
            const std::uint32_t cp =
                ((c & 0x0Fu) << 12) | ((c1 & 0x3Fu) << 6) | (c2 & 0x3Fu);
            if (cp < 0x800u) {
                return false;
            }
            if (cp >= 0xD800u && cp <= 0xDFFFu) {
                return false;
            }
            continue;
        }

        if ((c >> 3) == 0x1E) {
            if (e - p < 3) {
                return false;
            }
            const unsigned char c1 = *p++;
            const unsigned char c2 = *p++;
            const unsigned char c3 = *p++;
            if (!is_cont(c1) || !is_cont(c2) || !is_cont(c3)) {
                return false;
            }
            const std::uint32_t cp = ((c & 0x07u) << 18) | ((c1 & 0x3Fu) << 12)
                                     | ((c2 & 0x3Fu) << 6) | (c3 & 0x3Fu);
            if (cp < 0x10000u || cp > 0x10FFFFu) {
                return false;
            }
            continue;
        }

        return false;
    }
    return true;
}
}  // namespace j2m::utf8
