// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/facet/DescendingFacetSort.h"

#include "sieve/util/Exceptions.h"

namespace sieve {
namespace facet {

DescendingFacetSort::DescendingFacetSort(const kv::ReadTxn& rtxn, const kv::Database& db,
                                         FieldId fieldId, DocIdBitmap candidates)
    : index_(rtxn, db)
    , fieldId_(fieldId)
    , candidates_(std::move(candidates)) {}

void DescendingFacetSort::start() {
    started_ = true;
    if (candidates_.isEmpty()) {
        return;
    }
    auto highest = index_.highestLevel(fieldId_);
    auto first = index_.firstBound(fieldId_);
    auto last = index_.lastBound(fieldId_);
    if (!highest || !first || !last) {
        return;
    }

    auto right = kv::Bound::included(*last);
    stack_.push_back(Frame{index_.revRange(fieldId_, *highest, *first, right), *highest, UNBOUNDED,
                           std::move(candidates_), right});
}

std::optional<DocIdBitmap> DescendingFacetSort::next() {
    try {
        if (!started_) {
            start();
        }
        return advance();
    } catch (const SieveException& e) {
        stack_.clear();
        throw IterationException(std::string("Descending facet sort failed: ") + e.what());
    }
}

std::optional<DocIdBitmap> DescendingFacetSort::advance() {
    while (!stack_.empty()) {
        Frame& top = stack_.back();
        if (top.candidates.isEmpty() || top.remaining == 0 || !top.cursor.next()) {
            stack_.pop_back();
            continue;
        }
        if (top.remaining != UNBOUNDED) {
            top.remaining--;
        }

        auto key = FacetGroupKeyView::decode(top.cursor.key());
        if (key.fieldId != fieldId_) {
            stack_.clear();
            return std::nullopt;
        }

        auto value = FacetGroupValue::decode(top.cursor.value());
        Bytes bound = util::toBytes(key.leftBound);

        // The range of this sibling ends where the previous (larger) one began.
        kv::Bound siblingRight = std::move(top.rightBound);
        top.rightBound = kv::Bound::excluded(bound);

        DocIdBitmap common = value.bitmap & top.candidates;
        if (common.isEmpty()) {
            continue;
        }
        top.candidates -= common;

        if (top.level == 0) {
            return common;
        }

        uint8_t childLevel = top.level - 1;
        auto cursor = index_.revRange(fieldId_, childLevel, bound, siblingRight);
        const size_t children = value.isUnbounded() ? UNBOUNDED : value.size;
        stack_.push_back(Frame{std::move(cursor), childLevel, children, std::move(common),
                               std::move(siblingRight)});
    }
    return std::nullopt;
}

}  // namespace facet
}  // namespace sieve
