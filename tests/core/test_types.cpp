// STELLEND - Core Types Tests
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include <gtest/gtest.h>
#include "stellend/core/types.h"
#include "stellend/core/hex.h"
#include "stellend/core/status.h"

#include <limits>

namespace stellend {
namespace test {

// ============================================================================
// Checked Arithmetic Tests
// ============================================================================

TEST(CheckedArithmeticTest, AddWithinRange) {
    Amount out = 0;
    EXPECT_TRUE(CheckedAdd(700, 300, &out));
    EXPECT_EQ(out, 1000);
    EXPECT_TRUE(CheckedAdd(-5, 3, &out));
    EXPECT_EQ(out, -2);
}

TEST(CheckedArithmeticTest, AddOverflowDetected) {
    Amount out = 0;
    EXPECT_FALSE(CheckedAdd(std::numeric_limits<Amount>::max(), 1, &out));
    EXPECT_FALSE(CheckedAdd(std::numeric_limits<Amount>::min(), -1, &out));
}

TEST(CheckedArithmeticTest, MulOverflowDetected) {
    Amount out = 0;
    EXPECT_TRUE(CheckedMul(1000000, 9, &out));
    EXPECT_EQ(out, 9000000);
    EXPECT_FALSE(CheckedMul(std::numeric_limits<Amount>::max() / 2, 3, &out));
}

TEST(CheckedArithmeticTest, TimeAddition) {
    Timestamp out = 0;
    EXPECT_TRUE(CheckedAddTime(1000, 60, &out));
    EXPECT_EQ(out, 1060u);
    EXPECT_FALSE(CheckedAddTime(std::numeric_limits<Timestamp>::max(), 1, &out));
}

TEST(CheckedArithmeticTest, SaturatingSubFloorsAtZero) {
    EXPECT_EQ(SaturatingSub(10, 3), 7u);
    EXPECT_EQ(SaturatingSub(3, 10), 0u);
    EXPECT_EQ(SaturatingSub(5, 5), 0u);
}

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address a;
    EXPECT_TRUE(a.IsNull());
    EXPECT_EQ(a.size(), 32u);
}

TEST(AddressTest, HexRoundTrip) {
    std::string hex(64, '0');
    hex[0] = 'a';
    hex[1] = 'b';
    hex[63] = '7';

    Address a = Address::FromHex(hex);
    EXPECT_EQ(a[0], 0xab);
    EXPECT_EQ(a[31], 0x07);
    EXPECT_EQ(a.ToHex(), hex);
    EXPECT_EQ(a.ToShortString(), hex.substr(0, 12));
}

TEST(AddressTest, FromHexRejectsBadInput) {
    EXPECT_THROW(Address::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex(std::string(64, 'z')), std::invalid_argument);
}

TEST(AddressTest, Ordering) {
    Byte one = 1;
    Byte two = 2;
    Address a(&one, 1);
    Address b(&two, 1);
    EXPECT_LT(a, b);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, Address(&one, 1));
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, U64ToHexIsFixedWidth) {
    EXPECT_EQ(U64ToHex(0), "0000000000000000");
    EXPECT_EQ(U64ToHex(255), "00000000000000ff");
    EXPECT_EQ(U64ToHex(0x0123456789abcdefULL), "0123456789abcdef");
}

TEST(HexTest, ValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("zz"));
}

// ============================================================================
// Status Tests
// ============================================================================

TEST(StatusTest, DefaultIsOk) {
    Status s;
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.ToString(), "OK");
}

TEST(StatusTest, CodesAndPredicates) {
    EXPECT_TRUE(Status::Unauthorized().IsUnauthorized());
    EXPECT_TRUE(Status::InvalidAmount().IsInvalidAmount());
    EXPECT_TRUE(Status::NotFound().IsNotFound());
    EXPECT_TRUE(Status::ExternalCallFailed().IsExternalCallFailed());
    EXPECT_TRUE(Status::ReentrantCall().IsReentrantCall());
    EXPECT_TRUE(Status::StorageError().IsStorageError());
    EXPECT_FALSE(Status::NotFound().ok());
}

TEST(StatusTest, ToStringIncludesMessage) {
    EXPECT_EQ(Status::NotFound("proposal 7").ToString(), "NotFound: proposal 7");
    EXPECT_EQ(Status::Unauthorized().ToString(), "Unauthorized");
    EXPECT_STREQ(StatusCodeToString(Status::REENTRANT_CALL), "ReentrantCall");
}

} // namespace test
} // namespace stellend
