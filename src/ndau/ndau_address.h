/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace j2m::ndau {
inline constexpr std::size_t kAddressLength = 48;
inline constexpr std::string_view kAddressPrefix = "nd";

enum class AddressKind : char {
    User = 'a',
    Ndau = 'n',
    Endowment = 'e',
    Exchange = 'x',
    Bpc = 'b',
    MarketMaker = 'm',
};

bool is_valid_kind(char kind);

/**
 * Checks an ndau address on its face: length, "nd" prefix, kind character,
 * base32 body and the trailing 2-byte checksum. Returns a description of
 * the first problem found, or nullopt for a valid address.
 */
std::optional<std::string> find_address_problem(std::string_view addr);

inline bool is_valid_address(std::string_view addr) {
    return !find_address_problem(addr).has_value();
}
}  // namespace j2m::ndau
