// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/util/NumericUtils.h"

#include "sieve/util/Bytes.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

using namespace sieve::util;

namespace {

Bytes doubleBytes(double value) {
    Bytes out(8);
    NumericUtils::doubleToBytesBE(value, out.data());
    return out;
}

}  // namespace

// ==================== Double Sortable Bits ====================

TEST(NumericUtilsTest, DoubleRoundTrip) {
    const double values[] = {0.0, 1.0, -1.0, 3.14159, -2.5e300, 1e-300,
                             std::numeric_limits<double>::infinity(),
                             -std::numeric_limits<double>::infinity()};
    for (double v : values) {
        EXPECT_EQ(v, NumericUtils::sortableBitsToDouble(NumericUtils::doubleToSortableBits(v)));
        EXPECT_EQ(v, NumericUtils::bytesToDoubleBE(doubleBytes(v).data()));
    }
}

TEST(NumericUtilsTest, DoubleBytesOrderMatchesNumericOrder) {
    const std::vector<double> ascending = {-std::numeric_limits<double>::infinity(),
                                           -1e10,
                                           -1.5,
                                           -std::numeric_limits<double>::min(),
                                           0.0,
                                           std::numeric_limits<double>::min(),
                                           0.5,
                                           1.0,
                                           255.0,
                                           1e10,
                                           std::numeric_limits<double>::infinity()};
    for (size_t i = 1; i < ascending.size(); i++) {
        EXPECT_LT(compareBytes(doubleBytes(ascending[i - 1]), doubleBytes(ascending[i])), 0)
            << ascending[i - 1] << " vs " << ascending[i];
    }
}

TEST(NumericUtilsTest, NegativeZeroEncodesLikeZero) {
    EXPECT_EQ(doubleBytes(0.0), doubleBytes(-0.0));
}

// ==================== Big-Endian Integers ====================

TEST(NumericUtilsTest, ShortBigEndian) {
    uint8_t buf[2];
    NumericUtils::shortToBytesBE(0x0102, buf);
    EXPECT_EQ(0x01, buf[0]);
    EXPECT_EQ(0x02, buf[1]);
    EXPECT_EQ(0x0102, NumericUtils::bytesToShortBE(buf));
}

TEST(NumericUtilsTest, IntBigEndian) {
    uint8_t buf[4];
    NumericUtils::intToBytesBE(0xDEADBEEF, buf);
    EXPECT_EQ(0xDE, buf[0]);
    EXPECT_EQ(0xEF, buf[3]);
    EXPECT_EQ(0xDEADBEEFu, NumericUtils::bytesToIntBE(buf));
}

TEST(NumericUtilsTest, LongBigEndian) {
    uint8_t buf[8];
    NumericUtils::longToBytesBE(0x0102030405060708ULL, buf);
    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(i + 1, buf[i]);
    }
    EXPECT_EQ(0x0102030405060708ULL, NumericUtils::bytesToLongBE(buf));
}

TEST(NumericUtilsTest, IntBytesOrderMatchesNumericOrder) {
    uint8_t a[4];
    uint8_t b[4];
    NumericUtils::intToBytesBE(255, a);
    NumericUtils::intToBytesBE(256, b);
    EXPECT_LT(std::memcmp(a, b, 4), 0);
}
