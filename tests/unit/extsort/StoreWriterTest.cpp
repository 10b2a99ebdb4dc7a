// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/StoreWriter.h"

#include "sieve/extsort/MergeFunctions.h"
#include "sieve/util/DocIdBitmap.h"
#include "sieve/util/Exceptions.h"

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace sieve;
using namespace sieve::extsort;
using sieve::util::asSpan;
using sieve::util::DocIdBitmap;

class StoreWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto wtxn = env_.writeTxn();
        db_.emplace(wtxn.createDatabase("facets"));
        wtxn.commit();
    }

    std::string stored(const std::string& key) {
        auto rtxn = env_.readTxn();
        auto value = rtxn.get(*db_, asSpan(key));
        return value ? util::toString(*value) : "<none>";
    }

    kv::Environment env_;
    std::optional<kv::Database> db_;
};

TEST_F(StoreWriterTest, WritesNewKeys) {
    Sorter sorter(KeepLatestMerge::create());
    sorter.insert(asSpan("b"), asSpan("2"));
    sorter.insert(asSpan("a"), asSpan("1"));

    auto wtxn = env_.writeTxn();
    auto stats = sorterIntoDatabase(wtxn, *db_, std::move(sorter), KeepLatestMerge());
    wtxn.commit();

    EXPECT_EQ(2u, stats.entries);
    EXPECT_EQ(0u, stats.merged);
    EXPECT_EQ("1", stored("a"));
    EXPECT_EQ("2", stored("b"));
}

TEST_F(StoreWriterTest, MergesWithStoredValue) {
    {
        auto wtxn = env_.writeTxn();
        wtxn.put(*db_, asSpan("k"), DocIdBitmap{1, 2}.serialize());
        wtxn.commit();
    }

    Sorter sorter(UnionBitmapMerge::create());
    sorter.insert(asSpan("k"), DocIdBitmap{3}.serialize());
    sorter.insert(asSpan("new"), DocIdBitmap{4}.serialize());

    auto wtxn = env_.writeTxn();
    auto stats = sorterIntoDatabase(wtxn, *db_, std::move(sorter), UnionBitmapMerge());
    wtxn.commit();

    EXPECT_EQ(2u, stats.entries);
    EXPECT_EQ(1u, stats.merged);

    auto rtxn = env_.readTxn();
    EXPECT_EQ((DocIdBitmap{1, 2, 3}), DocIdBitmap::deserialize(*rtxn.get(*db_, asSpan("k"))));
    EXPECT_EQ((DocIdBitmap{4}), DocIdBitmap::deserialize(*rtxn.get(*db_, asSpan("new"))));
}

TEST_F(StoreWriterTest, WritesChunkContents) {
    InMemoryChunkCreator creator;
    ChunkWriter writer(creator);
    for (int i = 10; i < 20; i++) {
        writer.insert(asSpan("key" + std::to_string(i)), asSpan(std::to_string(i)));
    }
    auto reader = writer.intoReader();

    auto wtxn = env_.writeTxn();
    auto stats = writeIntoDatabase(wtxn, *db_, *reader, KeepLatestMerge());
    EXPECT_EQ(10u, stats.entries);
    EXPECT_EQ(10u, wtxn.len(*db_));
    wtxn.commit();
    EXPECT_EQ("15", stored("key15"));
}

TEST_F(StoreWriterTest, ConflictLeavesStoreUnchanged) {
    {
        auto wtxn = env_.writeTxn();
        wtxn.put(*db_, asSpan("k"), asSpan("stored"));
        wtxn.commit();
    }

    Sorter sorter(KeepLatestMerge::create());
    sorter.insert(asSpan("a"), asSpan("written before the conflict"));
    sorter.insert(asSpan("k"), asSpan("different"));

    {
        auto wtxn = env_.writeTxn();
        try {
            sorterIntoDatabase(wtxn, *db_, std::move(sorter), RequireIdenticalMerge());
            FAIL() << "expected a conflict";
        } catch (const MergeConflictException& e) {
            std::string message = e.what();
            EXPECT_NE(std::string::npos, message.find("database facets"));
            EXPECT_NE(std::string::npos, message.find("get-put-merge"));
        }
    }

    EXPECT_EQ("<none>", stored("a"));
    EXPECT_EQ("stored", stored("k"));
}

TEST_F(StoreWriterTest, IdenticalRewriteIsAccepted) {
    {
        auto wtxn = env_.writeTxn();
        wtxn.put(*db_, asSpan("k"), asSpan("same"));
        wtxn.commit();
    }

    Sorter sorter(RequireIdenticalMerge::create());
    sorter.insert(asSpan("k"), asSpan("same"));

    auto wtxn = env_.writeTxn();
    auto stats = sorterIntoDatabase(wtxn, *db_, std::move(sorter), RequireIdenticalMerge());
    wtxn.commit();
    EXPECT_EQ(1u, stats.merged);
    EXPECT_EQ("same", stored("k"));
}

TEST_F(StoreWriterTest, ReloadingWithKeepLatestIsIdempotent) {
    for (int round = 0; round < 2; round++) {
        Sorter sorter(KeepLatestMerge::create());
        sorter.insert(asSpan("a"), asSpan("old"));
        sorter.insert(asSpan("a"), asSpan("1"));
        sorter.insert(asSpan("b"), asSpan("2"));

        auto wtxn = env_.writeTxn();
        auto stats = sorterIntoDatabase(wtxn, *db_, std::move(sorter), KeepLatestMerge());
        wtxn.commit();
        EXPECT_EQ(round == 0 ? 0u : 2u, stats.merged);
    }

    EXPECT_EQ(2u, env_.readTxn().len(*db_));
    EXPECT_EQ("1", stored("a"));
    EXPECT_EQ("2", stored("b"));
}
