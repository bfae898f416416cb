/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "ndau/ndau_address.h"
#include "ndau/ndau_b32.h"
#include "ndau/ndau_crc16.h"
#include "test_bytes.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace j2m::ndau;

namespace {
constexpr const char* kUserAddress = "ndaegwggj8qv7tqccvz6ffrthkbnmencp9t2y4mn89gdq3yk";
constexpr const char* kNdauAddress = "ndnf9ffbzhyf8mk7z5vvqc4quzz5i2exp5zgsmhyhc9cuwr4";
constexpr const char* kMarketMakerAddress = "ndmfgnz9qby6nyi35aadjt9nasjqxqyd4vrswucwfmceqs3y";
}  // namespace

// ============================================================================
// CRC-16
// ============================================================================

TEST(NdauCrc16Test, CheckValues) {
    const auto data = j2m::test::bytes_of("123456789");
    EXPECT_EQ(address_checksum(data.data(), data.size()), 0xE5CCu);
    EXPECT_EQ(crc16_ccitt(0xFFFFu, data.data(), data.size()), 0x29B1u);
    EXPECT_EQ(crc16_ccitt(0x0000u, data.data(), data.size()), 0x31C3u);
}

TEST(NdauCrc16Test, EmptyInputReturnsSeed) {
    EXPECT_EQ(address_checksum(nullptr, 0), 0x1D0Fu);
}

// ============================================================================
// Base32
// ============================================================================

TEST(NdauB32Test, EncodeZeros) {
    const std::vector<std::uint8_t> zeros(5, 0);
    EXPECT_EQ(b32_encode(zeros), "aaaaaaaa");
    const std::vector<std::uint8_t> ones(5, 0xFF);
    EXPECT_EQ(b32_encode(ones), "99999999");
}

TEST(NdauB32Test, EncodeRejectsPartialGroup) {
    const std::vector<std::uint8_t> four(4, 0);
    EXPECT_THROW(b32_encode(four), std::invalid_argument);
}

TEST(NdauB32Test, DecodeRoundTripsAddress) {
    const auto data = b32_decode(kUserAddress);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->size(), 30u);
    EXPECT_EQ(b32_encode(*data), kUserAddress);
}

TEST(NdauB32Test, DecodeRejectsBadInput) {
    EXPECT_FALSE(b32_decode("aaaaaaa").has_value());
    // 'l', 'o', '0' and '1' are not in the alphabet, nor are capitals.
    EXPECT_FALSE(b32_decode("aaaaaaal").has_value());
    EXPECT_FALSE(b32_decode("aaaaaaa0").has_value());
    EXPECT_FALSE(b32_decode("aaaaaaa1").has_value());
    EXPECT_FALSE(b32_decode("AAAAAAAA").has_value());
    EXPECT_FALSE(b32_decode("aaaaaa==").has_value());
}

// ============================================================================
// Address validation
// ============================================================================

TEST(NdauAddressTest, KnownAddressesAreValid) {
    EXPECT_TRUE(is_valid_address(kUserAddress));
    EXPECT_TRUE(is_valid_address(kNdauAddress));
    EXPECT_TRUE(is_valid_address(kMarketMakerAddress));
    EXPECT_TRUE(is_valid_address("ndaea8w9gz84ncxrytepzxgkg9ymi4k7c9p427i6b57xw3r4"));
}

TEST(NdauAddressTest, EveryKindIsAccepted) {
    EXPECT_TRUE(is_valid_address("ndeegwggj8qv7tqccvz6ffrthkbnmencp9t2y4mn89gdrvr4"));
    EXPECT_TRUE(is_valid_address("ndxegwggj8qv7tqccvz6ffrthkbnmencp9t2y4mn89gdq47w"));
    EXPECT_TRUE(is_valid_address("ndbegwggj8qv7tqccvz6ffrthkbnmencp9t2y4mn89gdqvag"));
    EXPECT_TRUE(is_valid_address("ndmegwggj8qv7tqccvz6ffrthkbnmencp9t2y4mn89gdqz89"));
    for (const char k : std::string("anexbm")) {
        EXPECT_TRUE(is_valid_kind(k)) << k;
    }
    EXPECT_FALSE(is_valid_kind('z'));
    EXPECT_FALSE(is_valid_kind('A'));
}

TEST(NdauAddressTest, UnknownKindIsRejected) {
    // Checksum is correct for this body; only the kind character is wrong.
    const auto problem = find_address_problem("ndzegwggj8qv7tqccvz6ffrthkbnmencp9t2y4mn89gdqrtn");
    ASSERT_TRUE(problem.has_value());
    EXPECT_EQ(*problem, "invalid address kind: z");
}

TEST(NdauAddressTest, ChecksumFailure) {
    std::string addr = kUserAddress;
    addr.back() = 'm';
    const auto problem = find_address_problem(addr);
    ASSERT_TRUE(problem.has_value());
    EXPECT_EQ(*problem, "checksum failure");
}

TEST(NdauAddressTest, StructuralProblems) {
    EXPECT_NE(find_address_problem("nda")->find("not a valid address length"), std::string::npos);
    EXPECT_FALSE(is_valid_address(""));

    std::string prefix = kUserAddress;
    prefix[0] = 'x';
    EXPECT_EQ(*find_address_problem(prefix), "invalid address prefix");

    std::string upper = kUserAddress;
    upper[0] = 'N';
    EXPECT_FALSE(is_valid_address(upper));

    std::string bad_char = kUserAddress;
    bad_char[10] = '0';
    EXPECT_EQ(*find_address_problem(bad_char), "address is not valid base32");
}
