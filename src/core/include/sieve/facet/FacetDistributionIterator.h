// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/facet/FacetGroup.h"
#include "sieve/facet/FacetLevelIndex.h"
#include "sieve/kv/Environment.h"

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <vector>

namespace sieve {
namespace facet {

/**
 * @brief One facet value of a distribution.
 */
struct FacetDistributionEntry {
    /** Encoded facet value (level 0 left bound) */
    Bytes bound;
    /** Number of candidates having this value */
    uint64_t count = 0;
    /** Smallest candidate having this value */
    DocumentId docid = 0;
};

/**
 * @brief Visits the facet values of a field that occur among candidates,
 * in ascending value order.
 *
 * Starts at the highest level and only descends into groups whose bitmap
 * intersects the current candidate set, restricting the candidates to that
 * intersection and the child scan to the group's size. Values without
 * common documents are never reported. A key of another field ends the
 * iteration.
 *
 * Pull-based: the caller drives the traversal and may stop at any point
 * without further reads. The read transaction must outlive the iterator.
 *
 * Usage:
 * ```cpp
 * FacetDistributionIterator it(rtxn, db, fieldId, candidates);
 * while (auto entry = it.next()) {
 *     counts[OrderedF64Codec::decode(entry->bound)] = entry->count;
 * }
 * ```
 */
class FacetDistributionIterator {
public:
    FacetDistributionIterator(const kv::ReadTxn& rtxn, const kv::Database& db, FieldId fieldId,
                              DocIdBitmap candidates);

    /**
     * @return the next value, nullopt once the distribution is exhausted
     * @throws IterationException if reading or decoding the index fails
     */
    [[nodiscard]] std::optional<FacetDistributionEntry> next();

private:
    static constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

    struct Frame {
        kv::RangeCursor cursor;
        uint8_t level;
        size_t remaining;
        DocIdBitmap candidates;
    };

    void start();
    std::optional<FacetDistributionEntry> advance();

    FacetLevelIndex index_;
    FieldId fieldId_;
    DocIdBitmap candidates_;
    std::vector<Frame> stack_;
    bool started_ = false;
};

/**
 * Returned by distribution callbacks to continue or stop the traversal.
 */
enum class ControlFlow { Continue, Break };

using FacetDistributionCallback =
    std::function<ControlFlow(ByteSpan bound, uint64_t count, DocumentId docid)>;

/**
 * @brief Callback form of FacetDistributionIterator.
 *
 * The callback is invoked once per reported value; returning Break stops
 * the traversal immediately, so N invocations happen if it breaks on the
 * N-th.
 */
void iterateOverFacetDistribution(const kv::ReadTxn& rtxn, const kv::Database& db,
                                  FieldId fieldId, const DocIdBitmap& candidates,
                                  const FacetDistributionCallback& callback);

}  // namespace facet
}  // namespace sieve
