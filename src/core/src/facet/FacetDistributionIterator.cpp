// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/facet/FacetDistributionIterator.h"

#include "sieve/util/Exceptions.h"

namespace sieve {
namespace facet {

FacetDistributionIterator::FacetDistributionIterator(const kv::ReadTxn& rtxn,
                                                     const kv::Database& db, FieldId fieldId,
                                                     DocIdBitmap candidates)
    : index_(rtxn, db)
    , fieldId_(fieldId)
    , candidates_(std::move(candidates)) {}

void FacetDistributionIterator::start() {
    started_ = true;
    if (candidates_.isEmpty()) {
        return;
    }
    auto highest = index_.highestLevel(fieldId_);
    if (!highest) {
        return;
    }
    auto first = index_.firstBound(fieldId_);
    if (!first) {
        return;
    }
    stack_.push_back(
        Frame{index_.range(fieldId_, *highest, *first), *highest, UNBOUNDED, std::move(candidates_)});
}

std::optional<FacetDistributionEntry> FacetDistributionIterator::next() {
    try {
        if (!started_) {
            start();
        }
        return advance();
    } catch (const SieveException& e) {
        stack_.clear();
        throw IterationException(std::string("Facet distribution failed: ") + e.what());
    }
}

std::optional<FacetDistributionEntry> FacetDistributionIterator::advance() {
    while (!stack_.empty()) {
        Frame& top = stack_.back();
        if (top.remaining == 0 || !top.cursor.next()) {
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
        if (key.level != top.level) {
            stack_.pop_back();
            continue;
        }

        auto value = FacetGroupValue::decode(top.cursor.value());
        DocIdBitmap common = value.bitmap & top.candidates;
        if (common.isEmpty()) {
            continue;
        }

        if (top.level == 0) {
            return FacetDistributionEntry{util::toBytes(key.leftBound), common.cardinality(),
                                          *common.min()};
        }

        uint8_t childLevel = top.level - 1;
        Bytes bound = util::toBytes(key.leftBound);
        // push_back may reallocate; top is not used past this point.
        const size_t children = value.isUnbounded() ? UNBOUNDED : value.size;
        stack_.push_back(Frame{index_.range(fieldId_, childLevel, bound), childLevel, children,
                               std::move(common)});
    }
    return std::nullopt;
}

void iterateOverFacetDistribution(const kv::ReadTxn& rtxn, const kv::Database& db,
                                  FieldId fieldId, const DocIdBitmap& candidates,
                                  const FacetDistributionCallback& callback) {
    FacetDistributionIterator it(rtxn, db, fieldId, candidates);
    while (auto entry = it.next()) {
        if (callback(ByteSpan(entry->bound), entry->count, entry->docid) == ControlFlow::Break) {
            return;
        }
    }
}

}  // namespace facet
}  // namespace sieve
