// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/Chunk.h"

#include "sieve/compression/CompressionCodecs.h"
#include "sieve/store/ByteBuffersIndexInput.h"
#include "sieve/store/ByteBuffersIndexOutput.h"
#include "sieve/store/FSDirectory.h"
#include "sieve/util/Exceptions.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>

using namespace sieve;
using namespace sieve::extsort;
using sieve::util::asSpan;
using sieve::util::toString;

namespace {

std::string keyFor(int i) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "key%08d", i);
    return buf;
}

bool codecAvailable(ChunkCompression compression) {
    switch (compression) {
        case ChunkCompression::Fast:
            return compression::LZ4Codec::isAvailable();
        case ChunkCompression::High:
            return compression::ZSTDCodec::isAvailable();
        default:
            return true;
    }
}

}  // namespace

// ==================== Round Trip per Codec ====================

class ChunkCodecTest : public ::testing::TestWithParam<ChunkCompression> {};

TEST_P(ChunkCodecTest, RoundTripManyBlocks) {
    if (!codecAvailable(GetParam())) {
        GTEST_SKIP() << toString(GetParam()) << " codec not compiled in";
    }

    InMemoryChunkCreator creator;
    ChunkWriter writer(creator, GetParam());
    const int count = 5000;  // spans several 8 KiB blocks
    for (int i = 0; i < count; i++) {
        writer.insert(asSpan(keyFor(i)), asSpan("value-" + std::to_string(i * 7)));
    }
    auto reader = writer.intoReader();

    EXPECT_EQ(static_cast<uint64_t>(count), reader->entryCount());
    EXPECT_EQ(GetParam(), reader->compression());

    auto cursor = reader->cursor();
    int i = 0;
    while (cursor.moveOnNext()) {
        ASSERT_EQ(keyFor(i), toString(cursor.key()));
        ASSERT_EQ("value-" + std::to_string(i * 7), toString(cursor.value()));
        i++;
    }
    EXPECT_EQ(count, i);
    EXPECT_FALSE(cursor.moveOnNext());
}

INSTANTIATE_TEST_SUITE_P(AllCodecs, ChunkCodecTest,
                         ::testing::Values(ChunkCompression::None, ChunkCompression::Fast,
                                           ChunkCompression::High));

// ==================== Writer Contract ====================

TEST(ChunkTest, EmptyChunk) {
    InMemoryChunkCreator creator;
    ChunkWriter writer(creator);
    auto reader = writer.intoReader();
    EXPECT_TRUE(reader->isEmpty());
    EXPECT_FALSE(reader->cursor().moveOnNext());
}

TEST(ChunkTest, RejectsUnorderedKeys) {
    InMemoryChunkCreator creator;
    ChunkWriter writer(creator);
    writer.insert(asSpan("b"), asSpan("1"));
    EXPECT_THROW(writer.insert(asSpan("a"), asSpan("2")), std::invalid_argument);
    EXPECT_THROW(writer.insert(asSpan("b"), asSpan("2")), std::invalid_argument);
}

TEST(ChunkTest, InsertAfterFinishThrows) {
    InMemoryChunkCreator creator;
    ChunkWriter writer(creator);
    writer.insert(asSpan("a"), asSpan("1"));
    EXPECT_EQ(1u, writer.finish());
    EXPECT_EQ(1u, writer.finish());
    EXPECT_THROW(writer.insert(asSpan("b"), asSpan("2")), AlreadyClosedException);
}

TEST(ChunkTest, BorrowedOutputIsLeftOpen) {
    store::ByteBuffersIndexOutput output("borrowed");
    {
        ChunkWriter writer(output);
        writer.insert(asSpan("k"), asSpan("v"));
        writer.finish();
        EXPECT_THROW(writer.intoReader(), IOException);
    }
    output.writeByte(0);  // still writable
    EXPECT_GT(output.size(), chunk_format::HEADER_SIZE + chunk_format::FOOTER_SIZE);
}

TEST(ChunkTest, IndependentCursors) {
    InMemoryChunkCreator creator;
    ChunkWriter writer(creator);
    for (int i = 0; i < 3; i++) {
        writer.insert(asSpan(keyFor(i)), asSpan("v"));
    }
    auto reader = writer.intoReader();

    auto first = reader->cursor();
    ASSERT_TRUE(first.moveOnNext());
    ASSERT_TRUE(first.moveOnNext());

    auto second = reader->cursor();
    ASSERT_TRUE(second.moveOnNext());
    EXPECT_EQ(keyFor(0), toString(second.key()));
    EXPECT_EQ(keyFor(1), toString(first.key()));
}

// ==================== Corruption ====================

TEST(ChunkTest, BadMagicIsCorrupt) {
    std::vector<uint8_t> bytes(32, 0);
    EXPECT_THROW(ChunkReader(std::make_unique<store::ByteBuffersIndexInput>("bad", bytes)),
                 CorruptIndexException);
}

TEST(ChunkTest, FooterCountMismatchIsCorrupt) {
    store::ByteBuffersIndexOutput output("chunk");
    {
        ChunkWriter writer(output);
        writer.insert(asSpan("a"), asSpan("1"));
        writer.insert(asSpan("b"), asSpan("2"));
        writer.finish();
    }
    auto bytes = output.toArrayCopy();
    bytes.back() = 3;  // footer claims three entries

    ChunkReader reader(std::make_unique<store::ByteBuffersIndexInput>("chunk", bytes));
    EXPECT_EQ(3u, reader.entryCount());
    auto cursor = reader.cursor();
    EXPECT_TRUE(cursor.moveOnNext());
    EXPECT_TRUE(cursor.moveOnNext());
    EXPECT_THROW(cursor.moveOnNext(), CorruptIndexException);
}

// ==================== Temp Files ====================

class TempFileChunkTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "sieve_test_chunks";
        std::filesystem::remove_all(test_dir);
        dir = store::FSDirectory::open(test_dir);
    }

    void TearDown() override {
        dir.reset();
        std::filesystem::remove_all(test_dir);
    }

    size_t chunkFiles() const {
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            count += entry.is_regular_file() ? 1 : 0;
        }
        return count;
    }

    std::filesystem::path test_dir;
    std::unique_ptr<store::FSDirectory> dir;
};

TEST_F(TempFileChunkTest, FileLivesAsLongAsItsReaders) {
    TempFileChunkCreator creator(*dir);
    std::unique_ptr<ChunkReader> reader;
    {
        ChunkWriter writer(creator, ChunkCompression::None);
        writer.insert(asSpan("a"), asSpan("1"));
        reader = writer.intoReader();
    }
    EXPECT_EQ(1u, chunkFiles());

    auto source = reader->source();
    reader.reset();
    EXPECT_EQ(1u, chunkFiles());
    ASSERT_TRUE(source->next());
    EXPECT_EQ("a", toString(source->key()));

    source.reset();
    EXPECT_EQ(0u, chunkFiles());
}
