// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/ParallelSorter.h"

#include "sieve/extsort/DocumentChunker.h"
#include "sieve/extsort/MergeFunctions.h"
#include "sieve/util/DocIdBitmap.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace sieve;
using namespace sieve::extsort;
using sieve::util::asSpan;
using sieve::util::DocIdBitmap;

namespace {

Bytes docKey(uint32_t docid) {
    return Bytes{static_cast<uint8_t>(docid >> 24), static_cast<uint8_t>(docid >> 16),
                 static_cast<uint8_t>(docid >> 8), static_cast<uint8_t>(docid)};
}

/** 1000 documents whose value is their color. */
std::unique_ptr<ChunkReader> makeDocuments(ChunkCreator& creator) {
    static const char* colors[] = {"red", "green", "blue", "yellow"};
    ChunkWriter writer(creator);
    for (uint32_t docid = 0; docid < 1000; docid++) {
        writer.insert(docKey(docid), asSpan(colors[docid % 4]));
    }
    return writer.intoReader();
}

std::vector<std::unique_ptr<ChunkReader>> partition(const ChunkReader& documents,
                                                    ChunkCreator& creator) {
    DocumentChunker chunker(documents, ChunkParameters{}, 500, creator);
    std::vector<std::unique_ptr<ChunkReader>> partitions;
    while (auto part = chunker.next()) {
        partitions.push_back(std::move(part));
    }
    return partitions;
}

/** color -> bitmap of the documents with that color */
void extractColors(const ChunkReader& partition, Sorter& sorter) {
    auto cursor = partition.cursor();
    while (cursor.moveOnNext()) {
        auto key = cursor.key();
        uint32_t docid = (static_cast<uint32_t>(key[0]) << 24) | (static_cast<uint32_t>(key[1]) << 16) |
                         (static_cast<uint32_t>(key[2]) << 8) | key[3];
        sorter.insert(cursor.value(), DocIdBitmap{docid}.serialize());
    }
}

std::vector<std::pair<std::string, DocIdBitmap>> readAll(const ChunkReader& reader) {
    std::vector<std::pair<std::string, DocIdBitmap>> out;
    auto cursor = reader.cursor();
    while (cursor.moveOnNext()) {
        out.emplace_back(util::toString(cursor.key()), DocIdBitmap::deserialize(cursor.value()));
    }
    return out;
}

}  // namespace

TEST(ParallelSorterTest, ThreadCountDoesNotChangeResult) {
    auto creator = std::make_shared<InMemoryChunkCreator>();
    auto documents = makeDocuments(*creator);
    auto partitions = partition(*documents, *creator);
    ASSERT_GT(partitions.size(), 4u);

    ChunkParameters params;
    auto single = sortInParallel(partitions, extractColors, UnionBitmapMerge::create(), params, 1,
                                 creator);
    auto parallel = sortInParallel(partitions, extractColors, UnionBitmapMerge::create(), params, 4,
                                   creator);

    auto expected = readAll(*single);
    ASSERT_EQ(4u, expected.size());
    EXPECT_EQ("blue", expected[0].first);
    EXPECT_EQ(250u, expected[0].second.cardinality());
    EXPECT_TRUE(expected[0].second.contains(2));
    EXPECT_EQ(expected, readAll(*parallel));
}

TEST(ParallelSorterTest, MoreThreadsThanPartitions) {
    auto creator = std::make_shared<InMemoryChunkCreator>();
    auto documents = makeDocuments(*creator);
    std::vector<std::unique_ptr<ChunkReader>> partitions;
    partitions.push_back(std::move(documents));

    ChunkParameters params;
    params.maxMemory = 64 * 1024;
    auto result = sortInParallel(partitions, extractColors, UnionBitmapMerge::create(), params, 16,
                                 creator);
    EXPECT_EQ(4u, result->entryCount());
}

TEST(ParallelSorterTest, NoPartitions) {
    auto creator = std::make_shared<InMemoryChunkCreator>();
    std::vector<std::unique_ptr<ChunkReader>> partitions;
    auto result = sortInParallel(partitions, extractColors, UnionBitmapMerge::create(),
                                 ChunkParameters{}, 4, creator);
    EXPECT_TRUE(result->isEmpty());
}

TEST(ParallelSorterTest, WorkerExceptionPropagates) {
    auto creator = std::make_shared<InMemoryChunkCreator>();
    auto documents = makeDocuments(*creator);
    auto partitions = partition(*documents, *creator);

    const ChunkReader* poisoned = partitions[partitions.size() / 2].get();
    PartitionExtractor extractor = [poisoned](const ChunkReader& part, Sorter& sorter) {
        if (&part == poisoned) {
            throw std::runtime_error("extraction failed");
        }
        extractColors(part, sorter);
    };

    EXPECT_THROW(sortInParallel(partitions, extractor, UnionBitmapMerge::create(),
                                ChunkParameters{}, 3, creator),
                 std::runtime_error);
}

TEST(ParallelSorterTest, NonStandardExceptionOnCallingThreadPropagates) {
    auto creator = std::make_shared<InMemoryChunkCreator>();
    auto documents = makeDocuments(*creator);
    auto partitions = partition(*documents, *creator);
    ASSERT_GT(partitions.size(), 4u);

    // Partition 0 always goes to worker 0, which runs on the calling thread
    // while the other workers are still joinable.
    const ChunkReader* poisoned = partitions[0].get();
    PartitionExtractor extractor = [poisoned](const ChunkReader& part, Sorter& sorter) {
        if (&part == poisoned) {
            throw 42;
        }
        extractColors(part, sorter);
    };

    EXPECT_THROW(sortInParallel(partitions, extractor, UnionBitmapMerge::create(),
                                ChunkParameters{}, 4, creator),
                 int);
}

TEST(ParallelSorterTest, NonStandardExceptionOnWorkerThreadPropagates) {
    auto creator = std::make_shared<InMemoryChunkCreator>();
    auto documents = makeDocuments(*creator);
    auto partitions = partition(*documents, *creator);

    const ChunkReader* poisoned = partitions[1].get();
    PartitionExtractor extractor = [poisoned](const ChunkReader& part, Sorter& sorter) {
        if (&part == poisoned) {
            throw 7;
        }
        extractColors(part, sorter);
    };

    EXPECT_THROW(sortInParallel(partitions, extractor, UnionBitmapMerge::create(),
                                ChunkParameters{}, 2, creator),
                 int);
}

TEST(ParallelSorterTest, RequiresCreator) {
    std::vector<std::unique_ptr<ChunkReader>> partitions;
    EXPECT_THROW(sortInParallel(partitions, extractColors, UnionBitmapMerge::create(),
                                ChunkParameters{}, 1, nullptr),
                 std::invalid_argument);
}
