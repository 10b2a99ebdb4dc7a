// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/store/ByteBuffersIndexInput.h"
#include "sieve/store/ByteBuffersIndexOutput.h"

#include "sieve/util/Exceptions.h"

#include <gtest/gtest.h>

#include <limits>

using namespace sieve;
using namespace sieve::store;

TEST(IndexInputOutputTest, BigEndianIntegers) {
    ByteBuffersIndexOutput output("ints");
    output.writeInt(0x01020304);
    output.writeLong(std::numeric_limits<int64_t>::min());

    const auto& bytes = output.toArrayCopy();
    ASSERT_EQ(12u, bytes.size());
    EXPECT_EQ(0x01, bytes[0]);
    EXPECT_EQ(0x04, bytes[3]);
    EXPECT_EQ(0x80, bytes[4]);

    ByteBuffersIndexInput input("ints", output.buffer());
    EXPECT_EQ(0x01020304, input.readInt());
    EXPECT_EQ(std::numeric_limits<int64_t>::min(), input.readLong());
    EXPECT_EQ(input.length(), input.getFilePointer());
}

TEST(IndexInputOutputTest, VariableLengthIntegers) {
    ByteBuffersIndexOutput output("vints");
    output.writeVInt(0);
    output.writeVInt(127);
    output.writeVInt(128);
    output.writeVInt(std::numeric_limits<int32_t>::max());
    output.writeVInt(-1);

    ByteBuffersIndexInput input("vints", output.buffer());
    EXPECT_EQ(0, input.readVInt());
    EXPECT_EQ(127, input.readVInt());
    EXPECT_EQ(128, input.readVInt());
    EXPECT_EQ(std::numeric_limits<int32_t>::max(), input.readVInt());
    EXPECT_EQ(-1, input.readVInt());
    EXPECT_EQ(input.length(), input.getFilePointer());
}

TEST(IndexInputOutputTest, MalformedVIntThrows) {
    std::vector<uint8_t> bytes{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01};
    ByteBuffersIndexInput input("bad", bytes);
    EXPECT_THROW(input.readVInt(), IOException);
}

TEST(IndexInputOutputTest, ReadPastEndAndBadSeek) {
    ByteBuffersIndexInput input("tiny", std::vector<uint8_t>{1, 2});
    uint8_t buf[3];
    EXPECT_THROW(input.readBytes(buf, 3), EOFException);
    EXPECT_THROW(input.seek(3), IOException);
    input.seek(2);
    EXPECT_THROW(input.readByte(), EOFException);
}

TEST(IndexInputOutputTest, OutputAppendsToSharedBuffer) {
    auto buffer = std::make_shared<std::vector<uint8_t>>(std::vector<uint8_t>{9});
    ByteBuffersIndexOutput output("shared", buffer);
    output.writeByte(10);
    EXPECT_EQ(2, output.getFilePointer());
    EXPECT_EQ((std::vector<uint8_t>{9, 10}), *buffer);

    output.reset();
    EXPECT_EQ(0u, output.size());
}
