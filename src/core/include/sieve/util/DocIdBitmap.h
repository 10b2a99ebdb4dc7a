// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/util/Bytes.h"

#include <roaring/roaring.hh>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace sieve {
namespace util {

/** Document identifier, dense and assigned incrementally by the ingestion side. */
using DocumentId = uint32_t;

/**
 * @brief Ordered set of document ids with set algebra and a compact encoding.
 *
 * Backed by a roaring bitmap: dense runs of ids (a facet value shared by
 * most documents) cost a few bytes per 64K ids instead of four per id.
 *
 * Set operations follow the BitSet vocabulary: and (intersection),
 * or (union), andNot (difference).
 *
 * Serialized form: the portable roaring format, run-optimized.
 */
class DocIdBitmap {
public:
    DocIdBitmap() = default;

    DocIdBitmap(std::initializer_list<DocumentId> ids);

    /**
     * @brief Builds a bitmap from ids in any order; duplicates are dropped.
     */
    static DocIdBitmap fromUnsorted(const std::vector<DocumentId>& ids);

    /**
     * @brief Builds {first, first + 1, ..., last}. Empty when first > last.
     */
    static DocIdBitmap fromRange(DocumentId first, DocumentId last);

    // ==================== Single Element Access ====================

    /**
     * @return true if the id was not already present
     */
    bool insert(DocumentId id) { return roaring_.addChecked(id); }

    /**
     * @return true if the id was present
     */
    bool remove(DocumentId id) { return roaring_.removeChecked(id); }

    [[nodiscard]] bool contains(DocumentId id) const noexcept { return roaring_.contains(id); }

    [[nodiscard]] uint64_t cardinality() const noexcept { return roaring_.cardinality(); }

    [[nodiscard]] bool isEmpty() const noexcept { return roaring_.isEmpty(); }

    [[nodiscard]] std::optional<DocumentId> min() const noexcept;

    [[nodiscard]] std::optional<DocumentId> max() const noexcept;

    void clear() noexcept { roaring_ = roaring::Roaring(); }

    // ==================== Set Operations ====================

    /** In-place intersection */
    DocIdBitmap& operator&=(const DocIdBitmap& other) {
        roaring_ &= other.roaring_;
        return *this;
    }

    /** In-place union */
    DocIdBitmap& operator|=(const DocIdBitmap& other) {
        roaring_ |= other.roaring_;
        return *this;
    }

    /** In-place difference */
    DocIdBitmap& operator-=(const DocIdBitmap& other) {
        roaring_ -= other.roaring_;
        return *this;
    }

    /**
     * @brief Size of the intersection without materializing it.
     */
    [[nodiscard]] uint64_t intersectionLen(const DocIdBitmap& other) const noexcept {
        return roaring_.and_cardinality(other.roaring_);
    }

    [[nodiscard]] bool isDisjoint(const DocIdBitmap& other) const noexcept {
        return !roaring_.intersect(other.roaring_);
    }

    // ==================== Iteration ====================

    using const_iterator = roaring::Roaring::const_iterator;

    [[nodiscard]] const_iterator begin() const { return roaring_.begin(); }

    [[nodiscard]] const_iterator end() const { return roaring_.end(); }

    /**
     * @brief Copies the ids out in ascending order.
     */
    [[nodiscard]] std::vector<DocumentId> toVector() const;

    // ==================== Encoding ====================

    /**
     * @brief Appends the encoded bitmap to out.
     */
    void serializeInto(Bytes& out) const;

    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Decodes a bitmap produced by serializeInto.
     * @throws CorruptIndexException if the bytes are not one complete portable bitmap
     */
    static DocIdBitmap deserialize(ByteSpan bytes);

    /**
     * @brief Returns "[1, 2, 3]", the format used in test snapshots.
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const DocIdBitmap& other) const noexcept { return roaring_ == other.roaring_; }

    bool operator!=(const DocIdBitmap& other) const noexcept { return !(*this == other); }

    friend DocIdBitmap operator&(const DocIdBitmap& a, const DocIdBitmap& b);
    friend DocIdBitmap operator|(const DocIdBitmap& a, const DocIdBitmap& b);
    friend DocIdBitmap operator-(const DocIdBitmap& a, const DocIdBitmap& b);

private:
    explicit DocIdBitmap(roaring::Roaring roaring)
        : roaring_(std::move(roaring)) {}

    roaring::Roaring roaring_;
};

DocIdBitmap operator&(const DocIdBitmap& a, const DocIdBitmap& b);
DocIdBitmap operator|(const DocIdBitmap& a, const DocIdBitmap& b);
DocIdBitmap operator-(const DocIdBitmap& a, const DocIdBitmap& b);

}  // namespace util
}  // namespace sieve
