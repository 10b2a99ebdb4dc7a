// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/facet/FacetGroup.h"
#include "sieve/kv/Environment.h"

#include <optional>

namespace sieve {
namespace facet {

/**
 * @brief Read primitives over the facet entries of one database.
 *
 * Borrows a snapshot: the transaction must outlive the index and every
 * cursor it returns. All positions are expressed as (field, level, bound).
 *
 * Cursors opened by range() are right-open: they run past the end of the
 * requested level and field, and callers stop on the first key whose field
 * or level differs.
 */
class FacetLevelIndex {
public:
    FacetLevelIndex(const kv::ReadTxn& rtxn, kv::Database db)
        : rtxn_(rtxn)
        , db_(std::move(db)) {}

    /**
     * @return the highest level holding an entry of the field, nullopt if
     * the field has no entries
     */
    [[nodiscard]] std::optional<uint8_t> highestLevel(FieldId fieldId) const;

    /**
     * @return the smallest level-0 bound of the field
     */
    [[nodiscard]] std::optional<Bytes> firstBound(FieldId fieldId) const;

    /**
     * @return the largest level-0 bound of the field
     */
    [[nodiscard]] std::optional<Bytes> lastBound(FieldId fieldId) const;

    /**
     * @return the entry stored at exactly (field, level, bound)
     */
    [[nodiscard]] std::optional<FacetGroupValue> get(FieldId fieldId, uint8_t level,
                                                     ByteSpan bound) const;

    /**
     * @brief Ascending cursor from (field, level, startBound) inclusive,
     * unbounded on the right.
     */
    [[nodiscard]] kv::RangeCursor range(FieldId fieldId, uint8_t level, ByteSpan startBound) const;

    /**
     * @brief Descending cursor over bounds in [lowerBound, upperBound] of one
     * level. upperBound.key is a bound, not a full key; an unbounded upper
     * end stops at the last entry of the level.
     */
    [[nodiscard]] kv::RangeCursor revRange(FieldId fieldId, uint8_t level, ByteSpan lowerBound,
                                           const kv::Bound& upperBound) const;

    /**
     * @brief Number of entries at one level of the field.
     */
    [[nodiscard]] size_t levelSize(FieldId fieldId, uint8_t level) const;

    const kv::ReadTxn& txn() const noexcept { return rtxn_; }

    const kv::Database& database() const noexcept { return db_; }

    /**
     * @brief Exclusive upper bound of every key at (field, level).
     */
    static kv::Bound endOfLevel(FieldId fieldId, uint8_t level);

    /**
     * @brief Exclusive upper bound of every key of the field.
     */
    static kv::Bound endOfField(FieldId fieldId);

private:
    const kv::ReadTxn& rtxn_;
    kv::Database db_;
};

}  // namespace facet
}  // namespace sieve
