// STAKELEDGER - Serialization Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <endian.h>
#include <gtest/gtest.h>
#include "stakeledger/core/serialize.h"

#include <ios>

using namespace stakeledger;

// ============================================================================
// Integer Encoding
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ss;
    ss << uint32_t{0x01020304};
    std::string bytes = ss.str();
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(static_cast<uint8_t>(bytes[0]), 0x04);
    EXPECT_EQ(static_cast<uint8_t>(bytes[3]), 0x01);
}

TEST(SerializeTest, WideIntegersAreLittleEndian) {
    DataStream ss;
    ss << uint64_t{0x0102030405060708ULL};
    std::string bytes = ss.str();
    ASSERT_EQ(bytes.size(), 8u);
    EXPECT_EQ(static_cast<uint8_t>(bytes[0]), 0x08);
    EXPECT_EQ(static_cast<uint8_t>(bytes[7]), 0x01);

    uint64_t decoded = 0;
    ss >> decoded;
    EXPECT_EQ(decoded, 0x0102030405060708ULL);

    // The system endian macros stay usable beside DataStream
    EXPECT_EQ(le64toh(htole64(decoded)), decoded);
}

TEST(SerializeTest, SignedTimestampsSurvive) {
    DataStream ss;
    ss << int64_t{-42} << int64_t{1700000000};

    int64_t a = 0;
    int64_t b = 0;
    ss >> a >> b;
    EXPECT_EQ(a, -42);
    EXPECT_EQ(b, 1700000000);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, ReadPastEndThrows) {
    DataStream ss;
    ss << uint8_t{1};
    uint64_t value = 0;
    EXPECT_THROW(ss >> value, std::ios_base::failure);
}

// ============================================================================
// Compact Size
// ============================================================================

TEST(CompactSizeTest, EncodedLengths) {
    auto encodedLength = [](uint64_t n) {
        DataStream ss;
        WriteCompactSize(ss, n);
        return ss.size();
    };
    EXPECT_EQ(encodedLength(0), 1u);
    EXPECT_EQ(encodedLength(252), 1u);
    EXPECT_EQ(encodedLength(253), 5u);
    EXPECT_EQ(encodedLength(0xFFFFFFFF), 5u);
    EXPECT_EQ(encodedLength(0x100000000ULL), 9u);
}

TEST(CompactSizeTest, NonCanonicalRejected) {
    DataStream ss;
    ss << uint8_t{0xFE} << uint32_t{10};
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(CompactSizeTest, OversizeRejected) {
    DataStream ss;
    WriteCompactSize(ss, MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

// ============================================================================
// Strings, Addresses and Vectors
// ============================================================================

TEST(SerializeTest, StringIsLengthPrefixed) {
    DataStream ss;
    ss << std::string("STK");
    std::string bytes = ss.str();
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 3);
    EXPECT_EQ(bytes.substr(1), "STK");

    std::string decoded;
    ss >> decoded;
    EXPECT_EQ(decoded, "STK");
}

TEST(SerializeTest, AddressIsRawBytes) {
    Address addr = Address::FromHex("a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1");
    DataStream ss;
    ss << addr;
    EXPECT_EQ(ss.size(), Address::SIZE);

    Address decoded;
    ss >> decoded;
    EXPECT_EQ(decoded, addr);
}

TEST(SerializeTest, VectorOfAmounts) {
    std::vector<uint64_t> amounts = {1, 2, 300000};
    DataStream ss;
    ss << amounts;
    EXPECT_EQ(ss.size(), 1u + 3 * 8);

    std::vector<uint64_t> decoded = {99};
    ss >> decoded;
    EXPECT_EQ(decoded, amounts);
}

TEST(SerializeTest, TruncatedVectorThrows) {
    DataStream ss;
    WriteCompactSize(ss, 2);
    ss << uint64_t{5};

    std::vector<uint64_t> decoded;
    EXPECT_THROW(ss >> decoded, std::ios_base::failure);
}
