// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/kv/Environment.h"

#include "sieve/util/Exceptions.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace sieve;
using namespace sieve::kv;
using sieve::util::asSpan;
using sieve::util::toString;

namespace {

std::vector<std::string> collectKeys(RangeCursor cursor) {
    std::vector<std::string> keys;
    while (cursor.next()) {
        keys.push_back(toString(cursor.key()));
    }
    return keys;
}

}  // namespace

class EnvironmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "sieve_test_kv";
        std::filesystem::remove_all(test_dir);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir); }

    std::unique_ptr<Environment> openEnv() { return Environment::open(test_dir); }

    void fill(Environment& env, std::initializer_list<const char*> keys) {
        auto wtxn = env.writeTxn();
        auto db = wtxn.createDatabase("db");
        for (const char* key : keys) {
            wtxn.put(db, asSpan(key), asSpan(std::string("v-") + key));
        }
        wtxn.commit();
    }

    std::filesystem::path test_dir;
};

// ==================== Basic Operations ====================

TEST_F(EnvironmentTest, PutGetDelete) {
    Environment env;
    auto wtxn = env.writeTxn();
    auto db = wtxn.createDatabase("db");
    wtxn.put(db, asSpan("a"), asSpan("1"));
    wtxn.put(db, asSpan("a"), asSpan("2"));
    EXPECT_EQ("2", toString(*wtxn.get(db, asSpan("a"))));
    EXPECT_TRUE(wtxn.del(db, asSpan("a")));
    EXPECT_FALSE(wtxn.del(db, asSpan("a")));
    EXPECT_FALSE(wtxn.get(db, asSpan("a")).has_value());
    wtxn.commit();
    EXPECT_FALSE(wtxn.isActive());
    EXPECT_THROW(wtxn.put(db, asSpan("b"), asSpan("1")), AlreadyClosedException);
}

TEST_F(EnvironmentTest, OpenDatabase) {
    Environment env;
    EXPECT_FALSE(env.readTxn().openDatabase("db").has_value());
    fill(env, {"x"});

    auto rtxn = env.readTxn();
    auto db = rtxn.openDatabase("db");
    ASSERT_TRUE(db.has_value());
    EXPECT_EQ("db", db->name());
    EXPECT_EQ(1u, rtxn.len(*db));
    EXPECT_EQ(std::vector<std::string>{"db"}, rtxn.databaseNames());
}

// ==================== Ranges ====================

TEST_F(EnvironmentTest, ForwardAndReverseRanges) {
    Environment env;
    fill(env, {"a", "b", "c", "d", "e"});
    auto rtxn = env.readTxn();
    auto db = *rtxn.openDatabase("db");

    EXPECT_EQ((std::vector<std::string>{"b", "c", "d"}),
              collectKeys(rtxn.range(db, Bound::included(asSpan("b")),
                                     Bound::included(asSpan("d")))));
    EXPECT_EQ((std::vector<std::string>{"c", "d", "e"}),
              collectKeys(rtxn.range(db, Bound::excluded(asSpan("b")), Bound::unbounded())));
    EXPECT_EQ((std::vector<std::string>{"d", "c", "b"}),
              collectKeys(rtxn.revRange(db, Bound::included(asSpan("b")),
                                        Bound::excluded(asSpan("e")))));
    EXPECT_EQ((std::vector<std::string>{"e", "d", "c", "b", "a"}),
              collectKeys(rtxn.revRange(db, Bound::unbounded(), Bound::unbounded())));
}

TEST_F(EnvironmentTest, EmptyRanges) {
    Environment env;
    fill(env, {"a", "b", "c"});
    auto rtxn = env.readTxn();
    auto db = *rtxn.openDatabase("db");

    EXPECT_TRUE(collectKeys(rtxn.range(db, Bound::included(asSpan("c")),
                                       Bound::included(asSpan("a"))))
                    .empty());
    EXPECT_TRUE(collectKeys(rtxn.range(db, Bound::included(asSpan("b")),
                                       Bound::excluded(asSpan("b"))))
                    .empty());
    EXPECT_TRUE(collectKeys(rtxn.revRange(db, Bound::included(asSpan("x")), Bound::unbounded()))
                    .empty());
    EXPECT_EQ(std::vector<std::string>{"b"},
              collectKeys(rtxn.range(db, Bound::included(asSpan("b")),
                                     Bound::included(asSpan("b")))));
}

TEST_F(EnvironmentTest, DeleteRange) {
    Environment env;
    fill(env, {"a", "b", "c", "d"});
    auto wtxn = env.writeTxn();
    auto db = wtxn.createDatabase("db");
    EXPECT_EQ(2u, wtxn.deleteRange(db, Bound::excluded(asSpan("a")), Bound::included(asSpan("c"))));
    EXPECT_EQ((std::vector<std::string>{"a", "d"}),
              collectKeys(wtxn.range(db, Bound::unbounded(), Bound::unbounded())));
}

// ==================== Isolation ====================

TEST_F(EnvironmentTest, ReadersKeepTheirSnapshot) {
    Environment env;
    fill(env, {"a"});
    auto before = env.readTxn();
    auto cursor = before.range(*before.openDatabase("db"), Bound::unbounded(), Bound::unbounded());

    auto wtxn = env.writeTxn();
    auto db = wtxn.createDatabase("db");
    wtxn.put(db, asSpan("b"), asSpan("2"));
    wtxn.clear(db);
    wtxn.put(db, asSpan("z"), asSpan("3"));

    // Uncommitted writes are invisible to new readers too.
    EXPECT_EQ(1u, env.readTxn().len(db));
    wtxn.commit();

    EXPECT_EQ(std::vector<std::string>{"a"}, collectKeys(std::move(cursor)));
    EXPECT_EQ(1u, before.len(db));
    EXPECT_TRUE(env.readTxn().get(db, asSpan("z")).has_value());
    EXPECT_FALSE(env.readTxn().get(db, asSpan("a")).has_value());
}

TEST_F(EnvironmentTest, AbortDiscardsChanges) {
    Environment env;
    fill(env, {"a"});
    {
        auto wtxn = env.writeTxn();
        auto db = wtxn.createDatabase("db");
        wtxn.put(db, asSpan("b"), asSpan("2"));
        wtxn.createDatabase("other");
    }  // destructor aborts
    auto rtxn = env.readTxn();
    EXPECT_EQ(1u, rtxn.len(*rtxn.openDatabase("db")));
    EXPECT_FALSE(rtxn.openDatabase("other").has_value());
}

TEST_F(EnvironmentTest, SingleWriterAtATime) {
    Environment env;
    auto first = env.writeTxn();
    std::atomic<bool> secondStarted{false};

    std::thread writer([&] {
        auto second = env.writeTxn();
        secondStarted = true;
        second.commit();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(secondStarted.load());
    first.abort();
    writer.join();
    EXPECT_TRUE(secondStarted.load());
}

// ==================== Persistence ====================

TEST_F(EnvironmentTest, ReopenRestoresCommittedData) {
    {
        auto env = openEnv();
        fill(*env, {"k1", "k2"});
        auto wtxn = env->writeTxn();
        auto db = wtxn.createDatabase("db");
        wtxn.put(db, asSpan("k3"), asSpan("never committed"));
    }

    auto env = openEnv();
    auto rtxn = env->readTxn();
    auto db = rtxn.openDatabase("db");
    ASSERT_TRUE(db.has_value());
    EXPECT_EQ((std::vector<std::string>{"k1", "k2"}),
              collectKeys(rtxn.range(*db, Bound::unbounded(), Bound::unbounded())));
    EXPECT_EQ("v-k2", toString(*rtxn.get(*db, asSpan("k2"))));
}

TEST_F(EnvironmentTest, UncommittedDatabaseIsInvisible) {
    Environment env;
    {
        auto wtxn = env.writeTxn();
        auto db = wtxn.createDatabase("scratch");
        wtxn.put(db, asSpan("k"), asSpan("v"));
        EXPECT_TRUE(wtxn.openDatabase("scratch").has_value());
        EXPECT_EQ(std::vector<std::string>{"scratch"}, wtxn.databaseNames());
    }
    auto rtxn = env.readTxn();
    EXPECT_FALSE(rtxn.openDatabase("scratch").has_value());
    EXPECT_TRUE(rtxn.databaseNames().empty());

    // Recreating after the abort starts from an empty database
    auto wtxn = env.writeTxn();
    auto db = wtxn.createDatabase("scratch");
    EXPECT_TRUE(wtxn.isEmpty(db));
}

TEST_F(EnvironmentTest, ReservedDatabaseNameRejected) {
    Environment env;
    auto wtxn = env.writeTxn();
    EXPECT_THROW(wtxn.createDatabase(""), std::invalid_argument);
    EXPECT_THROW(wtxn.createDatabase("default"), std::invalid_argument);
}

TEST_F(EnvironmentTest, SecondOpenOfSameStoreFails) {
    auto env = openEnv();
    fill(*env, {"a"});
    EXPECT_THROW(openEnv(), IOException);
}

TEST_F(EnvironmentTest, CorruptCurrentFileThrows) {
    {
        auto env = openEnv();
        fill(*env, {"a"});
    }
    {
        // CURRENT names the manifest and must end with a newline
        std::ofstream current(test_dir / "CURRENT", std::ios::binary | std::ios::trunc);
        current << "garbage";
    }
    EXPECT_THROW(openEnv(), CorruptIndexException);
}
