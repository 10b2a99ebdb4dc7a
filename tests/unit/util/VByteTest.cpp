// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/util/VByte.h"

#include <gtest/gtest.h>
#include <limits>

using namespace sieve;
using namespace sieve::util;

// ==================== UInt32 Tests ====================

TEST(VByteTest, EncodeDecodeUInt32_Small) {
    for (uint32_t val = 0; val < 128; val++) {
        Bytes buffer;
        VByte::appendUInt32(buffer, val);
        EXPECT_EQ(1u, buffer.size());

        size_t pos = 0;
        EXPECT_EQ(val, VByte::readUInt32(buffer, pos));
        EXPECT_EQ(1u, pos);
    }
}

TEST(VByteTest, EncodeDecodeUInt32_Boundaries) {
    struct Case {
        uint32_t value;
        size_t bytes;
    };
    const Case cases[] = {{127, 1},     {128, 2},      {16383, 2},
                          {16384, 3},   {2097151, 3},  {2097152, 4},
                          {268435455, 4}, {268435456, 5}, {std::numeric_limits<uint32_t>::max(), 5}};
    for (const auto& c : cases) {
        Bytes buffer;
        VByte::appendUInt32(buffer, c.value);
        EXPECT_EQ(c.bytes, buffer.size()) << c.value;
        EXPECT_EQ(c.bytes, static_cast<size_t>(VByte::encodedSize(c.value))) << c.value;

        size_t pos = 0;
        EXPECT_EQ(c.value, VByte::readUInt32(buffer, pos));
        EXPECT_EQ(buffer.size(), pos);
    }
}

TEST(VByteTest, DecodeSequence) {
    Bytes buffer;
    const uint32_t values[] = {0, 300, 5, 1u << 30, 77};
    for (uint32_t v : values) {
        VByte::appendUInt32(buffer, v);
    }

    size_t pos = 0;
    for (uint32_t v : values) {
        EXPECT_EQ(v, VByte::readUInt32(buffer, pos));
    }
    EXPECT_EQ(buffer.size(), pos);
}

// ==================== UInt64 Tests ====================

TEST(VByteTest, EncodeDecodeUInt64) {
    const uint64_t values[] = {0, 1, 1ULL << 35, std::numeric_limits<uint64_t>::max()};
    for (uint64_t v : values) {
        Bytes buffer;
        VByte::appendUInt64(buffer, v);
        size_t pos = 0;
        EXPECT_EQ(v, VByte::readUInt64(buffer, pos));
        EXPECT_EQ(buffer.size(), pos);
    }
}

// ==================== Malformed Input ====================

TEST(VByteTest, TruncatedInputThrows) {
    Bytes buffer{0x80, 0x80};
    size_t pos = 0;
    EXPECT_THROW(VByte::readUInt32(buffer, pos), CorruptIndexException);
}

TEST(VByteTest, Overlong32BitValueThrows) {
    Bytes buffer{0xFF, 0xFF, 0xFF, 0xFF, 0x1F};
    size_t pos = 0;
    EXPECT_THROW(VByte::readUInt32(buffer, pos), CorruptIndexException);
}
