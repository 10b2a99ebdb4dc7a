// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/Chunk.h"
#include "sieve/extsort/ChunkCreator.h"
#include "sieve/extsort/MergeFunction.h"
#include "sieve/extsort/Sorter.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <vector>

namespace sieve {
namespace extsort {

/**
 * @brief Chunk settings shared by every stage of one bulk load.
 */
struct ChunkParameters {
    ChunkCompression compression = ChunkCompression::None;
    int compressionLevel = 0;

    /** Total memory budget of the load; unset = SorterOptions default per sorter */
    std::optional<size_t> maxMemory;

    /** Chunk count at which a sorter compacts; unset = unlimited */
    std::optional<size_t> maxNbChunks;

    /**
     * @brief The budget of one of numThreads concurrent sorters.
     */
    [[nodiscard]] std::optional<size_t> maxMemoryPerThread(size_t numThreads) const {
        if (!maxMemory) {
            return std::nullopt;
        }
        return *maxMemory / std::max<size_t>(numThreads, 1);
    }
};

/**
 * @brief Writer for a fresh chunk with the parameters' compression.
 */
std::unique_ptr<ChunkWriter> createWriter(const ChunkParameters& params, ChunkCreator& creator);

/**
 * @brief Sorter using the parameters' compression, chunk limit and the
 * given memory budget.
 *
 * With a memory budget the buffer is reserved up front and never
 * reallocated.
 */
Sorter createSorter(MergeFunctionPtr mergeFn, const ChunkParameters& params,
                    std::shared_ptr<ChunkCreator> creator,
                    std::optional<size_t> maxMemory = std::nullopt);

/**
 * @brief Merges several chunks into a single new one.
 */
std::unique_ptr<ChunkReader> mergeReaders(std::vector<std::unique_ptr<ChunkReader>> readers,
                                          MergeFunctionPtr mergeFn, const ChunkParameters& params,
                                          ChunkCreator& creator);

/**
 * @brief Drains a sorter into a single new chunk.
 */
std::unique_ptr<ChunkReader> sorterIntoReader(Sorter&& sorter, const ChunkParameters& params,
                                              ChunkCreator& creator);

}  // namespace extsort
}  // namespace sieve
