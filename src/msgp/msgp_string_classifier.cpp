/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgp/msgp_string_classifier.h"

#include "ndau/ndau_address.h"
#include "utils/base64.h"
#include "utils/utf8.h"

#include <utility>

namespace j2m::msgp {

StringLeaf classify_string(std::string_view s) {
    if (!utf8::is_valid(s)) {
        const auto* p = reinterpret_cast<const std::uint8_t*>(s.data());
        return StringLeaf{StringLeafKind::Bytes, std::vector<std::uint8_t>(p, p + s.size())};
    }
    if (ndau::is_valid_address(s)) {
        return StringLeaf{StringLeafKind::String, {}};
    }
    if (auto decoded = base64::decode_strict(s)) {
        return StringLeaf{StringLeafKind::Bytes, std::move(*decoded)};
    }
    return StringLeaf{StringLeafKind::String, {}};
}

void write_string_leaf(MsgpWriter& out, std::string_view s) {
    const auto leaf = classify_string(s);
    if (leaf.kind == StringLeafKind::Bytes) {
        out.write_bytes(leaf.bytes);
    } else {
        out.write_string(s);
    }
}

}  // namespace j2m::msgp
