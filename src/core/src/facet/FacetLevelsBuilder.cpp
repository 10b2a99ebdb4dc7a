// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/facet/FacetLevelsBuilder.h"

#include "sieve/facet/FacetLevelIndex.h"
#include "sieve/util/Exceptions.h"

#include <sstream>
#include <vector>

namespace sieve {
namespace facet {

namespace {

struct Group {
    Bytes leftBound;
    FacetGroupValue value;
};

std::string describe(FieldId fieldId, uint8_t level, ByteSpan bound) {
    std::ostringstream oss;
    oss << "(field " << fieldId << ", level " << static_cast<int>(level) << ", bound [";
    for (size_t i = 0; i < bound.size(); i++) {
        oss << (i > 0 ? " " : "") << static_cast<int>(bound[i]);
    }
    oss << "])";
    return oss.str();
}

}  // namespace

FacetLevelsBuilder::FacetLevelsBuilder(uint8_t groupSize, uint8_t minLevelSize)
    : groupSize_(groupSize)
    , minLevelSize_(minLevelSize) {
    if (groupSize < 2 || groupSize > MAX_GROUP_SIZE) {
        throw std::invalid_argument("Facet group size must be in [2, 127], got " +
                                    std::to_string(groupSize));
    }
    if (minLevelSize == 0) {
        throw std::invalid_argument("Facet min level size must be positive");
    }
}

void FacetLevelsBuilder::insert(kv::WriteTxn& wtxn, const kv::Database& db, FieldId fieldId,
                                ByteSpan bound, const DocIdBitmap& docids) const {
    if (docids.isEmpty()) {
        return;
    }
    auto key = FacetGroupKey::encode(fieldId, 0, bound);
    FacetGroupValue value{1, docids};
    if (auto existing = wtxn.get(db, key)) {
        value.bitmap |= FacetGroupValue::decode(*existing).bitmap;
    }
    wtxn.put(db, key, value.encode());
}

void FacetLevelsBuilder::remove(kv::WriteTxn& wtxn, const kv::Database& db, FieldId fieldId,
                                ByteSpan bound, const DocIdBitmap& docids) const {
    auto key = FacetGroupKey::encode(fieldId, 0, bound);
    auto existing = wtxn.get(db, key);
    if (!existing) {
        return;
    }
    auto value = FacetGroupValue::decode(*existing);
    value.bitmap -= docids;
    if (value.bitmap.isEmpty()) {
        wtxn.del(db, key);
    } else {
        wtxn.put(db, key, value.encode());
    }
}

uint8_t FacetLevelsBuilder::rebuild(kv::WriteTxn& wtxn, const kv::Database& db,
                                    FieldId fieldId) const {
    wtxn.deleteRange(db, kv::Bound::included(FacetGroupKey::encode(fieldId, 1, {})),
                     FacetLevelIndex::endOfField(fieldId));

    const size_t minEntries = static_cast<size_t>(groupSize_) * minLevelSize_;

    uint8_t level = 0;
    while (level < MAX_LEVEL) {
        std::vector<Group> groups;
        size_t entries = 0;
        {
            auto cursor = wtxn.range(db, kv::Bound::included(FacetGroupKey::encode(fieldId, level, {})),
                                     FacetLevelIndex::endOfLevel(fieldId, level));
            while (cursor.next()) {
                auto key = FacetGroupKeyView::decode(cursor.key());
                auto value = FacetGroupValue::decode(cursor.value());
                if (entries % groupSize_ == 0) {
                    groups.push_back(Group{util::toBytes(key.leftBound), FacetGroupValue{0, {}}});
                }
                auto& group = groups.back();
                group.value.size++;
                group.value.bitmap |= value.bitmap;
                entries++;
            }
        }

        if (entries < minEntries) {
            break;
        }

        for (const auto& group : groups) {
            wtxn.put(db, FacetGroupKey::encode(fieldId, level + 1, group.leftBound),
                     group.value.encode());
        }
        level++;
    }
    return level;
}

void FacetLevelsBuilder::checkUnionInvariant(const kv::ReadTxn& rtxn, const kv::Database& db,
                                             FieldId fieldId) {
    FacetLevelIndex index(rtxn, db);
    auto highest = index.highestLevel(fieldId);
    if (!highest) {
        return;
    }

    for (uint8_t level = *highest; level > 0; level--) {
        const uint8_t childLevel = level - 1;
        std::vector<Group> groups;
        {
            auto cursor = rtxn.range(db, kv::Bound::included(FacetGroupKey::encode(fieldId, level, {})),
                                     FacetLevelIndex::endOfLevel(fieldId, level));
            while (cursor.next()) {
                auto key = FacetGroupKeyView::decode(cursor.key());
                groups.push_back(Group{util::toBytes(key.leftBound),
                                       FacetGroupValue::decode(cursor.value())});
            }
        }

        auto children = rtxn.range(
            db, kv::Bound::included(FacetGroupKey::encode(fieldId, childLevel, {})),
            FacetLevelIndex::endOfLevel(fieldId, childLevel));
        bool haveChild = children.next();

        for (size_t g = 0; g < groups.size(); g++) {
            const auto& group = groups[g];
            const Bytes* nextBound = g + 1 < groups.size() ? &groups[g + 1].leftBound : nullptr;

            DocIdBitmap unionOfChildren;
            size_t childCount = 0;
            while (haveChild) {
                auto child = FacetGroupKeyView::decode(children.key());
                if (util::compareBytes(child.leftBound, group.leftBound) < 0) {
                    throw CorruptIndexException("Orphan entry before group " +
                                                describe(fieldId, level, group.leftBound));
                }
                if (nextBound && util::compareBytes(child.leftBound, *nextBound) >= 0) {
                    break;
                }
                unionOfChildren |= FacetGroupValue::decode(children.value()).bitmap;
                childCount++;
                haveChild = children.next();
            }

            if (unionOfChildren != group.value.bitmap) {
                throw CorruptIndexException("Group bitmap is not the union of its children: " +
                                            describe(fieldId, level, group.leftBound));
            }
            if (group.value.isUnbounded()) {
                if (nextBound) {
                    throw CorruptIndexException("Unbounded size on a group that is not last: " +
                                                describe(fieldId, level, group.leftBound));
                }
            } else if (childCount != group.value.size) {
                throw CorruptIndexException(
                    "Group size " + std::to_string(group.value.size) + " but " +
                    std::to_string(childCount) + " children: " +
                    describe(fieldId, level, group.leftBound));
            }
        }

        if (haveChild) {
            auto child = FacetGroupKeyView::decode(children.key());
            throw CorruptIndexException("Entry not covered by any group: " +
                                        describe(fieldId, childLevel, child.leftBound));
        }
    }
}

}  // namespace facet
}  // namespace sieve
