/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "msgp/msgp_writer.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace j2m::msgp {

enum class StringLeafKind {
    String,
    Bytes,
};

struct StringLeaf {
    StringLeafKind kind = StringLeafKind::String;
    // Raw or decoded bytes for Bytes; empty for String (the input is written as-is).
    std::vector<std::uint8_t> bytes;
};

/**
 * Picks the MessagePack type for a JSON string. First match wins:
 *   - not valid UTF-8: bin with the raw bytes
 *   - valid ndau address: str
 *   - canonical padded standard base64: bin with the decoded bytes
 *   - anything else: str
 * The address check runs before base64 because every ndau address also
 * decodes as base64.
 */
StringLeaf classify_string(std::string_view s);

void write_string_leaf(MsgpWriter& out, std::string_view s);

}  // namespace j2m::msgp
