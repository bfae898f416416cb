/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>

namespace j2m::ndau {
// CRC-16, polynomial 0x1021, MSB first, no final xor.
std::uint16_t crc16_ccitt(std::uint16_t seed, const std::uint8_t* data, std::size_t len);

// Address checksum variant (CRC-16/AUG-CCITT, seed 0x1D0F).
inline std::uint16_t address_checksum(const std::uint8_t* data, std::size_t len) {
    return crc16_ccitt(0x1D0Fu, data, len);
}
}  // namespace j2m::ndau
