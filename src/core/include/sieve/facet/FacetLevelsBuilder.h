// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/facet/FacetGroup.h"
#include "sieve/kv/Environment.h"

namespace sieve {
namespace facet {

/**
 * @brief Maintains level 0 entries and rebuilds the group levels of a field.
 *
 * Levels are built bottom-up: groupSize consecutive entries of level L
 * become one entry of level L+1 (left bound of the first child, size = the
 * number of children, bitmap = union of the children). A level is only
 * added while it would hold at least minLevelSize groups, i.e. while
 * level L has at least groupSize * minLevelSize entries.
 *
 * Usage:
 * ```cpp
 * FacetLevelsBuilder builder;  // group size 4, min level size 5
 * builder.insert(wtxn, db, fieldId, OrderedF64Codec::encode(12.5), {docid});
 * builder.rebuild(wtxn, db, fieldId);
 * wtxn.commit();
 * ```
 */
class FacetLevelsBuilder {
public:
    static constexpr uint8_t DEFAULT_GROUP_SIZE = 4;
    static constexpr uint8_t DEFAULT_MIN_LEVEL_SIZE = 5;
    static constexpr uint8_t MAX_GROUP_SIZE = 127;
    static constexpr uint8_t MAX_LEVEL = 254;

    /**
     * @throws std::invalid_argument if groupSize is outside [2, 127] or
     * minLevelSize is 0
     */
    explicit FacetLevelsBuilder(uint8_t groupSize = DEFAULT_GROUP_SIZE,
                                uint8_t minLevelSize = DEFAULT_MIN_LEVEL_SIZE);

    [[nodiscard]] uint8_t groupSize() const noexcept { return groupSize_; }

    [[nodiscard]] uint8_t minLevelSize() const noexcept { return minLevelSize_; }

    /**
     * @brief Adds docids to the level 0 entry of bound, creating it if needed.
     *
     * Group levels are not updated; call rebuild() once the field is settled.
     */
    void insert(kv::WriteTxn& wtxn, const kv::Database& db, FieldId fieldId, ByteSpan bound,
                const DocIdBitmap& docids) const;

    /**
     * @brief Removes docids from the level 0 entry of bound, deleting the
     * entry when it becomes empty.
     */
    void remove(kv::WriteTxn& wtxn, const kv::Database& db, FieldId fieldId, ByteSpan bound,
                const DocIdBitmap& docids) const;

    /**
     * @brief Replaces every level >= 1 of the field.
     * @return the highest level after the rebuild (0 if no group level was built)
     */
    uint8_t rebuild(kv::WriteTxn& wtxn, const kv::Database& db, FieldId fieldId) const;

    /**
     * @brief Verifies that every group is the union of the children in its range
     * and that its size matches the child count. Only the last group of a
     * level may carry the unbounded size.
     * @throws CorruptIndexException naming the first offending group
     */
    static void checkUnionInvariant(const kv::ReadTxn& rtxn, const kv::Database& db,
                                    FieldId fieldId);

private:
    uint8_t groupSize_;
    uint8_t minLevelSize_;
};

}  // namespace facet
}  // namespace sieve
