// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/Chunk.h"
#include "sieve/extsort/ChunkCreator.h"
#include "sieve/extsort/MergeFunction.h"
#include "sieve/extsort/Merger.h"
#include "sieve/observability/Metrics.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace sieve {
namespace extsort {

/**
 * @brief Tuning of a Sorter.
 */
struct SorterOptions {
    static constexpr size_t DEFAULT_DUMP_THRESHOLD = 100 * 1024 * 1024;

    /** Buffered bytes (keys + values + per-entry overhead) before a spill */
    size_t dumpThreshold = DEFAULT_DUMP_THRESHOLD;

    /** Chunk count at which all chunks are merged into one; unset = unlimited */
    std::optional<size_t> maxNbChunks;

    ChunkCompression compression = ChunkCompression::None;

    /** ZSTD level for ChunkCompression::High, 0 for the default */
    int compressionLevel = 0;

    /** Where spilled chunks go; in memory when unset */
    std::shared_ptr<ChunkCreator> chunkCreator;

    /** When false the buffer is reserved once at dumpThreshold and never grows */
    bool allowRealloc = true;

    /** Log spills and compactions to stderr */
    bool verbose = false;
};

/**
 * @brief Accumulates unsorted key/value pairs under a memory budget.
 *
 * Entries are buffered in an arena. When the next insert would push the
 * buffer past dumpThreshold, the buffer is stable-sorted by key, runs of
 * equal keys are coalesced with the merge function (values in insertion
 * order) and the result is written as a new chunk. Reaching maxNbChunks
 * merges every chunk into one.
 *
 * intoStream() hands the chunks plus the sorted in-memory remainder to a
 * MergerIterator, which yields the same sequence whatever the threshold:
 * spilling is invisible in the output.
 *
 * Usage:
 * ```cpp
 * SorterOptions options;
 * options.dumpThreshold = 64 * 1024 * 1024;
 * options.chunkCreator = std::make_shared<TempFileChunkCreator>(*tmpDir);
 * Sorter sorter(UnionBitmapMerge::create(), options);
 * sorter.insert(key, value);
 * auto stream = sorter.intoStream();
 * ```
 *
 * Not thread-safe; parallel builds use one Sorter per thread.
 */
class Sorter {
public:
    Sorter(MergeFunctionPtr mergeFn, SorterOptions options = {});

    Sorter(Sorter&&) = default;
    Sorter& operator=(Sorter&&) = default;
    Sorter(const Sorter&) = delete;
    Sorter& operator=(const Sorter&) = delete;

    /**
     * @brief Buffers one entry, spilling first if the budget would be exceeded.
     * @throws MergeConflictException if coalescing during a spill fails
     */
    void insert(ByteSpan key, ByteSpan value);

    /**
     * @brief Consumes the sorter into a merged, sorted stream.
     */
    MergerIterator intoStream();

    /**
     * @brief Drains intoStream() into writer. Does not finish the writer.
     */
    void writeIntoChunkWriter(ChunkWriter& writer);

    /** Chunks currently spilled (after compactions). */
    [[nodiscard]] size_t chunkCount() const noexcept { return chunks_.size(); }

    /** Spills performed since construction. */
    [[nodiscard]] size_t spillCount() const noexcept { return spillCount_; }

    /** Entries inserted since construction. */
    [[nodiscard]] uint64_t entryCount() const noexcept { return entryCount_; }

    /** Bytes currently buffered, overhead included. */
    [[nodiscard]] size_t memoryUsage() const noexcept;

    [[nodiscard]] const MergeFunctionPtr& mergeFunction() const noexcept { return mergeFn_; }

    [[nodiscard]] const SorterOptions& options() const noexcept { return options_; }

private:
    struct EntryRef {
        size_t offset;
        uint32_t keyLen;
        uint32_t valueLen;
    };

    static constexpr size_t ENTRY_OVERHEAD = sizeof(EntryRef);

    ByteSpan keyOf(const EntryRef& e) const {
        return ByteSpan(arena_.data() + e.offset, e.keyLen);
    }

    ByteSpan valueOf(const EntryRef& e) const {
        return ByteSpan(arena_.data() + e.offset + e.keyLen, e.valueLen);
    }

    void sortBuffer();
    void spill();
    void compact();

    MergeFunctionPtr mergeFn_;
    SorterOptions options_;

    Bytes arena_;
    std::vector<EntryRef> entries_;
    std::vector<std::unique_ptr<ChunkReader>> chunks_;

    size_t spillCount_ = 0;
    uint64_t entryCount_ = 0;

    std::shared_ptr<observability::Counter> spillsCounter_;
    std::shared_ptr<observability::Counter> entriesCounter_;
    std::shared_ptr<observability::Counter> compactionsCounter_;
    std::shared_ptr<observability::Gauge> bufferedBytes_;
};

}  // namespace extsort
}  // namespace sieve
