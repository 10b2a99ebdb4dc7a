// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/facet/FacetGroup.h"
#include "sieve/facet/FacetLevelIndex.h"
#include "sieve/kv/Environment.h"

#include <limits>
#include <optional>
#include <vector>

namespace sieve {
namespace facet {

/**
 * @brief Yields the candidates grouped by facet value, largest value first.
 *
 * Each call to next() returns the candidates having the next smaller value
 * of the field, never empty. The results are pairwise disjoint and their
 * union is exactly the candidates that have a value for the field.
 *
 * Walks the levels with an explicit stack of frames. A frame scans the
 * siblings of one level from right to left inside [left bound, right
 * bound], keeps the candidates not yet handed out, and moves its right
 * bound left past every sibling it has seen, so a child frame covers
 * exactly the range of its group.
 *
 * The read transaction must outlive the iterator.
 *
 * Usage:
 * ```cpp
 * DescendingFacetSort sort(rtxn, db, priceFieldId, candidates);
 * while (auto docids = sort.next()) {
 *     page.append(*docids);
 * }
 * ```
 */
class DescendingFacetSort {
public:
    DescendingFacetSort(const kv::ReadTxn& rtxn, const kv::Database& db, FieldId fieldId,
                        DocIdBitmap candidates);

    /**
     * @return the documents of the next value, nullopt when done
     * @throws IterationException if reading or decoding the index fails
     */
    [[nodiscard]] std::optional<DocIdBitmap> next();

private:
    static constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

    struct Frame {
        kv::RangeCursor cursor;
        uint8_t level;
        size_t remaining;
        DocIdBitmap candidates;
        kv::Bound rightBound;
    };

    void start();
    std::optional<DocIdBitmap> advance();

    FacetLevelIndex index_;
    FieldId fieldId_;
    DocIdBitmap candidates_;
    std::vector<Frame> stack_;
    bool started_ = false;
};

}  // namespace facet
}  // namespace sieve
