// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/facet/FacetLevelIndex.h"

#include <limits>

namespace sieve {
namespace facet {

kv::Bound FacetLevelIndex::endOfLevel(FieldId fieldId, uint8_t level) {
    if (level == std::numeric_limits<uint8_t>::max()) {
        return endOfField(fieldId);
    }
    return kv::Bound::excluded(FacetGroupKey::encode(fieldId, level + 1, {}));
}

kv::Bound FacetLevelIndex::endOfField(FieldId fieldId) {
    if (fieldId == std::numeric_limits<FieldId>::max()) {
        return kv::Bound::unbounded();
    }
    return kv::Bound::excluded(FacetGroupKey::encode(fieldId + 1, 0, {}));
}

std::optional<uint8_t> FacetLevelIndex::highestLevel(FieldId fieldId) const {
    auto cursor = rtxn_.revRange(db_, kv::Bound::included(FacetGroupKey::encode(fieldId, 0, {})),
                                 endOfField(fieldId));
    if (!cursor.next()) {
        return std::nullopt;
    }
    return FacetGroupKeyView::decode(cursor.key()).level;
}

std::optional<Bytes> FacetLevelIndex::firstBound(FieldId fieldId) const {
    auto cursor = rtxn_.range(db_, kv::Bound::included(FacetGroupKey::encode(fieldId, 0, {})),
                              endOfLevel(fieldId, 0));
    if (!cursor.next()) {
        return std::nullopt;
    }
    return util::toBytes(FacetGroupKeyView::decode(cursor.key()).leftBound);
}

std::optional<Bytes> FacetLevelIndex::lastBound(FieldId fieldId) const {
    auto cursor = rtxn_.revRange(db_, kv::Bound::included(FacetGroupKey::encode(fieldId, 0, {})),
                                 endOfLevel(fieldId, 0));
    if (!cursor.next()) {
        return std::nullopt;
    }
    return util::toBytes(FacetGroupKeyView::decode(cursor.key()).leftBound);
}

std::optional<FacetGroupValue> FacetLevelIndex::get(FieldId fieldId, uint8_t level,
                                                    ByteSpan bound) const {
    auto bytes = rtxn_.get(db_, FacetGroupKey::encode(fieldId, level, bound));
    if (!bytes) {
        return std::nullopt;
    }
    return FacetGroupValue::decode(*bytes);
}

kv::RangeCursor FacetLevelIndex::range(FieldId fieldId, uint8_t level, ByteSpan startBound) const {
    return rtxn_.range(db_, kv::Bound::included(FacetGroupKey::encode(fieldId, level, startBound)),
                       kv::Bound::unbounded());
}

kv::RangeCursor FacetLevelIndex::revRange(FieldId fieldId, uint8_t level, ByteSpan lowerBound,
                                          const kv::Bound& upperBound) const {
    auto lower = kv::Bound::included(FacetGroupKey::encode(fieldId, level, lowerBound));
    switch (upperBound.kind) {
        case kv::Bound::Kind::Included:
            return rtxn_.revRange(
                db_, lower, kv::Bound::included(FacetGroupKey::encode(fieldId, level, upperBound.key)));
        case kv::Bound::Kind::Excluded:
            return rtxn_.revRange(
                db_, lower, kv::Bound::excluded(FacetGroupKey::encode(fieldId, level, upperBound.key)));
        case kv::Bound::Kind::Unbounded:
        default:
            return rtxn_.revRange(db_, lower, endOfLevel(fieldId, level));
    }
}

size_t FacetLevelIndex::levelSize(FieldId fieldId, uint8_t level) const {
    auto cursor = rtxn_.range(db_, kv::Bound::included(FacetGroupKey::encode(fieldId, level, {})),
                              endOfLevel(fieldId, level));
    size_t count = 0;
    while (cursor.next()) {
        count++;
    }
    return count;
}

}  // namespace facet
}  // namespace sieve
