/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "ndau_crc16.h"

namespace j2m::ndau {
namespace {
constexpr std::uint16_t poly = 0x1021u;

static std::uint16_t table_entry(std::uint16_t i) {
    std::uint16_t crc = static_cast<std::uint16_t>(i << 8);
    for (int bit = 0; bit < 8; bit++) {
        crc = (crc & 0x8000u) != 0 ? static_cast<std::uint16_t>((crc << 1) ^ poly)
                                   : static_cast<std::uint16_t>(crc << 1);
    }
    return crc;
}
}  // namespace

std::uint16_t crc16_ccitt(std::uint16_t seed, const std::uint8_t* data, std::size_t len) {
    std::uint16_t crc = seed;
    for (std::size_t i = 0; i < len; i++) {
        const std::uint16_t idx = ((crc >> 8) ^ data[i]) & 0xFFu;
        crc = static_cast<std::uint16_t>(table_entry(idx) ^ (crc << 8));
    }
    return crc;
}
}  // namespace j2m::ndau
