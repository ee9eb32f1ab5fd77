// STAKELEDGER - Core Types Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/core/hex.h"
#include "stakeledger/core/types.h"

#include <map>
#include <stdexcept>

using namespace stakeledger;

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, BytesToHex) {
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "000fa5ff");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>{}), "");
}

TEST(HexTest, HexToBytesAcceptsBothCases) {
    std::vector<uint8_t> expected = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(HexToBytes("deadbeef"), expected);
    EXPECT_EQ(HexToBytes("DEADBEEF"), expected);
}

TEST(HexTest, HexToBytesRejectsBadInput) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0g"));
}

TEST(HexTest, StripHexPrefix) {
    EXPECT_EQ(StripHexPrefix("0xabcd"), "abcd");
    EXPECT_EQ(StripHexPrefix("0Xabcd"), "abcd");
    EXPECT_EQ(StripHexPrefix("abcd"), "abcd");
    EXPECT_EQ(StripHexPrefix("0"), "0");
}

// ============================================================================
// Amount Tests
// ============================================================================

TEST(AmountTest, CheckedAdd) {
    Amount out = 7;
    EXPECT_TRUE(CheckedAdd(1, 2, out));
    EXPECT_EQ(out, 3u);

    EXPECT_TRUE(CheckedAdd(MAX_AMOUNT - 1, 1, out));
    EXPECT_EQ(out, MAX_AMOUNT);

    out = 7;
    EXPECT_FALSE(CheckedAdd(MAX_AMOUNT, 1, out));
    EXPECT_EQ(out, 7u);
}

TEST(AmountTest, TimeConstants) {
    EXPECT_EQ(SECONDS_PER_DAY, 86400);
    EXPECT_EQ(SECONDS_PER_YEAR, 31536000);
}

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.ToHex(), std::string(40, '0'));
}

TEST(AddressTest, SetNull) {
    std::array<Byte, Address::SIZE> bytes;
    bytes.fill(0x11);
    Address addr(bytes);
    EXPECT_FALSE(addr.IsNull());
    addr.SetNull();
    EXPECT_TRUE(addr.IsNull());
}

TEST(AddressTest, HexRoundTrip) {
    const std::string hex = "00112233445566778899aabbccddeeff00112233";
    Address addr = Address::FromHex(hex);
    EXPECT_EQ(addr.ToHex(), hex);
    EXPECT_EQ(addr[0], 0x00);
    EXPECT_EQ(addr[19], 0x33);
    EXPECT_THROW(Address::FromHex("0011"), std::invalid_argument);
}

TEST(AddressTest, ParseAddress) {
    Address addr;
    ASSERT_TRUE(ParseAddress("0xa1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1", addr));
    EXPECT_EQ(addr[5], 0xa1);

    Address other;
    ASSERT_TRUE(ParseAddress("A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1", other));
    EXPECT_EQ(addr, other);
}

TEST(AddressTest, ParseAddressRejectsMalformed) {
    Address addr;
    EXPECT_FALSE(ParseAddress("", addr));
    EXPECT_FALSE(ParseAddress("0x", addr));
    EXPECT_FALSE(ParseAddress("a1a1", addr));
    EXPECT_FALSE(ParseAddress(std::string(42, 'a'), addr));
    EXPECT_FALSE(ParseAddress("g1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1", addr));
    EXPECT_TRUE(addr.IsNull());
}

TEST(AddressTest, RawBytesArePadded) {
    Byte raw[3] = {1, 2, 3};
    Address addr(raw, sizeof(raw));
    EXPECT_EQ(addr[2], 3);
    EXPECT_EQ(addr[3], 0);
}

TEST(AddressTest, OrderingForMaps) {
    std::map<Address, int> byAddress;
    byAddress[Address::FromHex(std::string(40, 'f'))] = 2;
    byAddress[Address()] = 1;

    ASSERT_EQ(byAddress.size(), 2u);
    EXPECT_TRUE(byAddress.begin()->first.IsNull());
}
