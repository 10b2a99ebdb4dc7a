// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/MergeFunction.h"
#include "sieve/extsort/MergeSource.h"
#include "sieve/observability/Metrics.h"

#include <memory>
#include <queue>
#include <vector>

namespace sieve {
namespace extsort {

/**
 * @brief K-way merge of sorted sources into one sorted, duplicate-free stream.
 *
 * Sources sit in a std::priority_queue ordered smallest (current key, push
 * index) first. When several
 * sources hold the same key, their values are collected in push order and
 * combined with the merge function; a key held by a single source passes
 * through untouched.
 */
class MergerIterator : public MergeSource {
public:
    MergerIterator(MergerIterator&&) = default;
    MergerIterator& operator=(MergerIterator&&) = default;

    /**
     * @throws MergeConflictException if the merge function refuses
     */
    bool next() override;

    ByteSpan key() const override { return ByteSpan(currentKey_); }

    ByteSpan value() const override { return ByteSpan(currentValue_); }

    [[nodiscard]] size_t sourceCount() const noexcept { return sources_.size(); }

private:
    friend class MergerBuilder;

    MergerIterator(MergeFunctionPtr mergeFn, std::vector<std::unique_ptr<MergeSource>> sources);

    struct HeapEntry {
        MergeSource* source;
        size_t index;  // push order, breaks ties between equal keys
    };

    /** Inverted ordering so the queue top is the smallest entry. */
    struct HeapGreater {
        bool operator()(const HeapEntry& a, const HeapEntry& b) const;
    };

    MergeFunctionPtr mergeFn_;
    std::vector<std::unique_ptr<MergeSource>> sources_;
    std::priority_queue<HeapEntry, std::vector<HeapEntry>, HeapGreater> heap_;
    bool initialized_ = false;

    Bytes currentKey_;
    Bytes currentValue_;
    std::vector<Bytes> pendingValues_;

    std::shared_ptr<observability::Counter> mergedKeys_;
};

/**
 * @brief Collects the sources of a merge.
 *
 * Usage:
 * ```cpp
 * MergerBuilder builder(UnionBitmapMerge::create());
 * builder.push(readerA.source());
 * builder.push(readerB.source());
 * auto merger = builder.build();
 * while (merger.next()) { ... }
 * ```
 */
class MergerBuilder {
public:
    explicit MergerBuilder(MergeFunctionPtr mergeFn);

    /**
     * @brief Adds a source; earlier sources hold older values.
     */
    MergerBuilder& push(std::unique_ptr<MergeSource> source);

    MergerIterator build();

private:
    MergeFunctionPtr mergeFn_;
    std::vector<std::unique_ptr<MergeSource>> sources_;
};

}  // namespace extsort
}  // namespace sieve
