// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/facet/FacetLevelsBuilder.h"

#include "FacetTestUtils.h"
#include "sieve/facet/FacetBoundCodecs.h"
#include "sieve/facet/FacetLevelIndex.h"
#include "sieve/util/Exceptions.h"

#include <gtest/gtest.h>

using namespace sieve;
using namespace sieve::facet;
using namespace sieve::facet::fixtures;

namespace {

/** Field 0: value i -> {i} for i in 0..count. */
void fillField(kv::WriteTxn& wtxn, const kv::Database& db, const FacetLevelsBuilder& builder,
               uint32_t count) {
    for (uint32_t i = 0; i < count; i++) {
        builder.insert(wtxn, db, 0, OrderedF64Codec::encode(i), DocIdBitmap{i});
    }
}

}  // namespace

TEST(FacetLevelsBuilderTest, SimpleIndexLevels) {
    auto fixture = buildSimpleIndex();
    auto rtxn = fixture.env->readTxn();
    FacetLevelIndex index(rtxn, fixture.db);

    // 256 -> 64 -> 16; 16 < 4 * 5 so no third level.
    EXPECT_EQ(2, index.highestLevel(0));
    EXPECT_EQ(256u, index.levelSize(0, 0));
    EXPECT_EQ(64u, index.levelSize(0, 1));
    EXPECT_EQ(16u, index.levelSize(0, 2));
    EXPECT_EQ(0u, index.levelSize(0, 3));

    auto top = index.get(0, 2, OrderedF64Codec::encode(16));
    ASSERT_TRUE(top.has_value());
    EXPECT_EQ(4, top->size);
    EXPECT_EQ(DocIdBitmap::fromRange(16, 31), top->bitmap);

    EXPECT_NO_THROW(FacetLevelsBuilder::checkUnionInvariant(rtxn, fixture.db, 0));
}

TEST(FacetLevelsBuilderTest, FirstAndLastBound) {
    auto fixture = buildSimpleIndex();
    auto rtxn = fixture.env->readTxn();
    FacetLevelIndex index(rtxn, fixture.db);

    EXPECT_EQ(0.0, OrderedF64Codec::decode(*index.firstBound(0)));
    EXPECT_EQ(255.0, OrderedF64Codec::decode(*index.lastBound(0)));
    EXPECT_FALSE(index.firstBound(1).has_value());
    EXPECT_FALSE(index.highestLevel(1).has_value());
}

TEST(FacetLevelsBuilderTest, LevelNeedsGroupSizeTimesMinLevelSize) {
    kv::Environment env;
    auto wtxn = env.writeTxn();
    auto db = wtxn.createDatabase("facets");
    FacetLevelsBuilder builder(4, 5);

    fillField(wtxn, db, builder, 19);
    EXPECT_EQ(0, builder.rebuild(wtxn, db, 0));

    builder.insert(wtxn, db, 0, OrderedF64Codec::encode(19), DocIdBitmap{19});
    EXPECT_EQ(1, builder.rebuild(wtxn, db, 0));

    FacetLevelIndex index(wtxn, db);
    EXPECT_EQ(5u, index.levelSize(0, 1));
}

TEST(FacetLevelsBuilderTest, LastGroupMayBePartial) {
    kv::Environment env;
    auto wtxn = env.writeTxn();
    auto db = wtxn.createDatabase("facets");
    FacetLevelsBuilder builder(4, 2);

    fillField(wtxn, db, builder, 10);
    EXPECT_EQ(1, builder.rebuild(wtxn, db, 0));

    FacetLevelIndex index(wtxn, db);
    EXPECT_EQ(3u, index.levelSize(0, 1));
    auto last = index.get(0, 1, OrderedF64Codec::encode(8));
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(2, last->size);
    EXPECT_EQ((DocIdBitmap{8, 9}), last->bitmap);
    EXPECT_NO_THROW(FacetLevelsBuilder::checkUnionInvariant(wtxn, db, 0));
}

TEST(FacetLevelsBuilderTest, InsertMergesDocids) {
    kv::Environment env;
    auto wtxn = env.writeTxn();
    auto db = wtxn.createDatabase("facets");
    FacetLevelsBuilder builder;

    auto bound = OrderedF64Codec::encode(42.5);
    builder.insert(wtxn, db, 3, bound, DocIdBitmap{1});
    builder.insert(wtxn, db, 3, bound, DocIdBitmap{7, 2});
    builder.insert(wtxn, db, 3, bound, DocIdBitmap{});

    FacetLevelIndex index(wtxn, db);
    auto value = index.get(3, 0, bound);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(1, value->size);
    EXPECT_EQ((DocIdBitmap{1, 2, 7}), value->bitmap);
}

TEST(FacetLevelsBuilderTest, RemoveAndRebuild) {
    kv::Environment env;
    auto wtxn = env.writeTxn();
    auto db = wtxn.createDatabase("facets");
    FacetLevelsBuilder builder;

    fillField(wtxn, db, builder, 100);
    builder.insert(wtxn, db, 0, OrderedF64Codec::encode(5), DocIdBitmap{500});
    EXPECT_EQ(2, builder.rebuild(wtxn, db, 0));

    // Removing some docids keeps the entry; removing all deletes it.
    builder.remove(wtxn, db, 0, OrderedF64Codec::encode(5), DocIdBitmap{5});
    for (uint32_t i = 20; i < 100; i++) {
        builder.remove(wtxn, db, 0, OrderedF64Codec::encode(i), DocIdBitmap{i});
    }
    builder.remove(wtxn, db, 0, OrderedF64Codec::encode(1000), DocIdBitmap{1});
    EXPECT_EQ(1, builder.rebuild(wtxn, db, 0));

    FacetLevelIndex index(wtxn, db);
    EXPECT_EQ(20u, index.levelSize(0, 0));
    EXPECT_EQ(5u, index.levelSize(0, 1));
    EXPECT_EQ(0u, index.levelSize(0, 2));
    EXPECT_EQ((DocIdBitmap{500}), index.get(0, 0, OrderedF64Codec::encode(5))->bitmap);
    EXPECT_NO_THROW(FacetLevelsBuilder::checkUnionInvariant(wtxn, db, 0));
}

TEST(FacetLevelsBuilderTest, RebuildIsIdempotentAndLeavesOtherFieldsAlone) {
    auto fixture = buildTwoFieldIndex();
    {
        auto rtxn = fixture.env->readTxn();
        FacetLevelIndex index(rtxn, fixture.db);
        EXPECT_EQ(2, index.highestLevel(0));
        EXPECT_EQ(1, index.highestLevel(1));
        EXPECT_EQ(16u, index.levelSize(1, 1));
    }

    auto wtxn = fixture.env->writeTxn();
    FacetLevelsBuilder builder;
    size_t entries = wtxn.len(fixture.db);
    EXPECT_EQ(2, builder.rebuild(wtxn, fixture.db, 0));
    EXPECT_EQ(entries, wtxn.len(fixture.db));

    FacetLevelIndex index(wtxn, fixture.db);
    EXPECT_EQ(16u, index.levelSize(1, 1));
    EXPECT_NO_THROW(FacetLevelsBuilder::checkUnionInvariant(wtxn, fixture.db, 0));
    EXPECT_NO_THROW(FacetLevelsBuilder::checkUnionInvariant(wtxn, fixture.db, 1));
}

TEST(FacetLevelsBuilderTest, UnionInvariantDetectsTampering) {
    auto fixture = buildSimpleIndex();
    auto wtxn = fixture.env->writeTxn();

    // A docid added at level 0 without a rebuild is missing from its groups.
    wtxn.put(fixture.db, FacetGroupKey::encode(0, 0, OrderedF64Codec::encode(3)),
             FacetGroupValue{1, DocIdBitmap{3, 999}}.encode());
    EXPECT_THROW(FacetLevelsBuilder::checkUnionInvariant(wtxn, fixture.db, 0),
                 CorruptIndexException);

    FacetLevelsBuilder().rebuild(wtxn, fixture.db, 0);
    EXPECT_NO_THROW(FacetLevelsBuilder::checkUnionInvariant(wtxn, fixture.db, 0));

    // A group whose size disagrees with its child count.
    wtxn.put(fixture.db, FacetGroupKey::encode(0, 1, OrderedF64Codec::encode(0)),
             FacetGroupValue{3, DocIdBitmap{0, 1, 2, 3, 999}}.encode());
    EXPECT_THROW(FacetLevelsBuilder::checkUnionInvariant(wtxn, fixture.db, 0),
                 CorruptIndexException);
}

TEST(FacetLevelsBuilderTest, UnboundedSizeOnlyOnLastGroup) {
    auto fixture = buildUnboundedLastGroupIndex(7, 3);
    auto wtxn = fixture.env->writeTxn();
    EXPECT_NO_THROW(FacetLevelsBuilder::checkUnionInvariant(wtxn, fixture.db, 0));

    wtxn.put(fixture.db, FacetGroupKey::encode(0, 1, OrderedF64Codec::encode(0)),
             FacetGroupValue{FacetGroupValue::UNBOUNDED_SIZE, DocIdBitmap{0, 1, 2}}.encode());
    EXPECT_THROW(FacetLevelsBuilder::checkUnionInvariant(wtxn, fixture.db, 0),
                 CorruptIndexException);
}

TEST(FacetLevelsBuilderTest, RandomIndexSatisfiesUnionInvariant) {
    for (uint8_t groupSize : {2, 3, 4, 7, 127}) {
        for (uint8_t minLevelSize : {1, 2, 5}) {
            auto fixture = buildRandomIndex(groupSize, minLevelSize);
            auto rtxn = fixture.env->readTxn();
            EXPECT_NO_THROW(FacetLevelsBuilder::checkUnionInvariant(rtxn, fixture.db, 0))
                << "group size " << int(groupSize) << ", min level size " << int(minLevelSize);
        }
    }
}

TEST(FacetLevelsBuilderTest, InvalidParameters) {
    EXPECT_THROW(FacetLevelsBuilder(1, 5), std::invalid_argument);
    EXPECT_THROW(FacetLevelsBuilder(128, 5), std::invalid_argument);
    EXPECT_THROW(FacetLevelsBuilder(4, 0), std::invalid_argument);
    EXPECT_NO_THROW(FacetLevelsBuilder(127, 1));
}
