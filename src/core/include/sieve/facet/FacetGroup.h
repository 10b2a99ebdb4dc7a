// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/MergeFunction.h"
#include "sieve/util/Bytes.h"
#include "sieve/util/DocIdBitmap.h"

#include <cstdint>

namespace sieve {
namespace facet {

using util::Bytes;
using util::ByteSpan;
using util::DocIdBitmap;
using util::DocumentId;

using FieldId = uint16_t;

/**
 * @brief Key of a facet entry: (field, level, left bound).
 *
 * Encoded as field id (u16 big-endian) | level (u8) | left bound, so byte
 * order equals (field, level, bound) order. Level 0 entries are single
 * facet values; level L > 0 entries summarize a group of level L-1 entries
 * starting at leftBound.
 */
struct FacetGroupKey {
    static constexpr size_t PREFIX_SIZE = 3;

    FieldId fieldId = 0;
    uint8_t level = 0;
    Bytes leftBound;

    [[nodiscard]] Bytes encode() const { return encode(fieldId, level, leftBound); }

    static Bytes encode(FieldId fieldId, uint8_t level, ByteSpan leftBound);

    /**
     * @throws CorruptIndexException if bytes is shorter than the prefix
     */
    static FacetGroupKey decode(ByteSpan bytes);

    bool operator==(const FacetGroupKey& other) const {
        return fieldId == other.fieldId && level == other.level && leftBound == other.leftBound;
    }
};

/**
 * @brief Borrowed decoding of a key, valid while the bytes are.
 */
struct FacetGroupKeyView {
    FieldId fieldId = 0;
    uint8_t level = 0;
    ByteSpan leftBound;

    /**
     * @throws CorruptIndexException if bytes is shorter than the prefix
     */
    static FacetGroupKeyView decode(ByteSpan bytes);
};

/**
 * @brief Value of a facet entry: child count and document set.
 *
 * Encoded as size (u8) | DocIdBitmap. The bitmap of a group is the union of
 * its children's bitmaps; level 0 entries have size 1.
 *
 * Size 0xFF marks the last group of a level: readers take every remaining
 * child instead of a fixed count.
 */
struct FacetGroupValue {
    static constexpr uint8_t UNBOUNDED_SIZE = 0xFF;

    uint8_t size = 1;
    DocIdBitmap bitmap;

    [[nodiscard]] bool isUnbounded() const noexcept { return size == UNBOUNDED_SIZE; }

    [[nodiscard]] Bytes encode() const;

    /**
     * @throws CorruptIndexException on an empty or malformed value
     */
    static FacetGroupValue decode(ByteSpan bytes);
};

/**
 * @brief Merges FacetGroupValues of one level: bitmaps are unioned, the
 * largest size is kept.
 */
class FacetGroupValueMerge : public extsort::MergeFunction {
public:
    Bytes merge(ByteSpan key, const std::vector<ByteSpan>& values) const override;

    std::string getName() const override { return "facet-group-value"; }

    static extsort::MergeFunctionPtr create();
};

}  // namespace facet
}  // namespace sieve
