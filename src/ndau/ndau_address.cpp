/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "ndau/ndau_address.h"

#include "ndau/ndau_b32.h"
#include "ndau/ndau_crc16.h"

#include <cstdint>

namespace j2m::ndau {
bool is_valid_kind(char kind) {
    switch (static_cast<AddressKind>(kind)) {
        case AddressKind::User:
        case AddressKind::Ndau:
        case AddressKind::Endowment:
        case AddressKind::Exchange:
        case AddressKind::Bpc:
        case AddressKind::MarketMaker:
            return true;
        default:
            return false;
    }
}

std::optional<std::string> find_address_problem(std::string_view addr) {
    if (addr.size() != kAddressLength) {
        return "not a valid address length (expected " + std::to_string(kAddressLength) + ", got "
               + std::to_string(addr.size()) + ")";
    }
    if (addr.substr(0, kAddressPrefix.size()) != kAddressPrefix) {
        return std::string("invalid address prefix");
    }
    if (!is_valid_kind(addr[2])) {
        return std::string("invalid address kind: ") + addr[2];
    }
    const auto data = b32_decode(addr);
    if (!data.has_value()) {
        return std::string("address is not valid base32");
    }

    // 28 bytes of prefix+hash, then the checksum, big-endian.
    const std::size_t body_len = data->size() - 2;
    const std::uint16_t expected = address_checksum(data->data(), body_len);
    const std::uint16_t stored = static_cast<std::uint16_t>(
        (static_cast<std::uint16_t>((*data)[body_len]) << 8) | (*data)[body_len + 1]
    );
    if (expected != stored) {
        return std::string("checksum failure");
    }
    return std::nullopt;
}
}  // namespace j2m::ndau
