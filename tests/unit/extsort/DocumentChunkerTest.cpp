// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/DocumentChunker.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

using namespace sieve;
using namespace sieve::extsort;
using sieve::util::asSpan;

namespace {

/** count entries "key000".."keyNNN", each 6 key bytes + 4 value bytes */
std::unique_ptr<ChunkReader> makeSource(ChunkCreator& creator, int count) {
    ChunkWriter writer(creator);
    for (int i = 0; i < count; i++) {
        char key[16];
        std::snprintf(key, sizeof(key), "key%03d", i);
        writer.insert(asSpan(key), asSpan("vvvv"));
    }
    return writer.intoReader();
}

std::vector<std::unique_ptr<ChunkReader>> drain(DocumentChunker& chunker) {
    std::vector<std::unique_ptr<ChunkReader>> out;
    while (auto chunk = chunker.next()) {
        out.push_back(std::move(chunk));
    }
    return out;
}

}  // namespace

TEST(DocumentChunkerTest, SplitsAtSizeThreshold) {
    InMemoryChunkCreator creator;
    auto source = makeSource(creator, 100);

    // 10 bytes per entry, 35 bytes per chunk: a chunk closes after 4 entries.
    DocumentChunker chunker(*source, ChunkParameters{}, 35, creator);
    auto chunks = drain(chunker);

    ASSERT_EQ(25u, chunks.size());
    for (const auto& chunk : chunks) {
        EXPECT_EQ(4u, chunk->entryCount());
    }
    EXPECT_EQ(nullptr, chunker.next());
}

TEST(DocumentChunkerTest, PreservesOrderAndContent) {
    InMemoryChunkCreator creator;
    auto source = makeSource(creator, 57);

    DocumentChunker chunker(*source, ChunkParameters{}, 100, creator);
    auto chunks = drain(chunker);
    EXPECT_EQ(6u, chunks.size());
    EXPECT_EQ(7u, chunks.back()->entryCount());

    auto expected = source->cursor();
    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        auto cursor = chunk->cursor();
        while (cursor.moveOnNext()) {
            ASSERT_TRUE(expected.moveOnNext());
            EXPECT_EQ(util::toString(expected.key()), util::toString(cursor.key()));
            total++;
        }
    }
    EXPECT_FALSE(expected.moveOnNext());
    EXPECT_EQ(57u, total);
}

TEST(DocumentChunkerTest, LargeSizeGivesSingleChunk) {
    InMemoryChunkCreator creator;
    auto source = makeSource(creator, 10);

    DocumentChunker chunker(*source, ChunkParameters{},
                            DocumentChunker::DEFAULT_DOCUMENTS_CHUNK_SIZE, creator);
    auto chunks = drain(chunker);
    ASSERT_EQ(1u, chunks.size());
    EXPECT_EQ(10u, chunks[0]->entryCount());
}

TEST(DocumentChunkerTest, EmptySourceYieldsOneEmptyChunk) {
    InMemoryChunkCreator creator;
    auto source = makeSource(creator, 0);

    DocumentChunker chunker(*source, ChunkParameters{}, 100, creator);
    auto first = chunker.next();
    ASSERT_NE(nullptr, first);
    EXPECT_TRUE(first->isEmpty());
    EXPECT_EQ(nullptr, chunker.next());
}

TEST(DocumentChunkerTest, SubChunksUseParameterCompression) {
    InMemoryChunkCreator creator;
    auto source = makeSource(creator, 20);

    ChunkParameters params;
    params.compression = ChunkCompression::None;
    DocumentChunker chunker(*source, params, 50, creator);
    auto chunks = drain(chunker);
    ASSERT_EQ(4u, chunks.size());
    EXPECT_EQ(ChunkCompression::None, chunks[0]->compression());
}

TEST(DocumentChunkerTest, ZeroSizeRejected) {
    InMemoryChunkCreator creator;
    auto source = makeSource(creator, 1);
    EXPECT_THROW(DocumentChunker(*source, ChunkParameters{}, 0, creator), std::invalid_argument);
}
