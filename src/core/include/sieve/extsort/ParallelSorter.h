// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/Chunk.h"
#include "sieve/extsort/ChunkCreator.h"
#include "sieve/extsort/ChunkParameters.h"
#include "sieve/extsort/MergeFunction.h"
#include "sieve/extsort/Sorter.h"

#include <functional>
#include <memory>
#include <vector>

namespace sieve {
namespace extsort {

/**
 * @brief Feeds the entries extracted from one partition into a sorter.
 *
 * Called concurrently from several threads, each time with a different
 * partition and the calling thread's own sorter.
 */
using PartitionExtractor = std::function<void(const ChunkReader& partition, Sorter& sorter)>;

/**
 * @brief Extracts every partition on numThreads workers and merges the result.
 *
 * Worker w handles partitions w, w + numThreads, ... into its own Sorter
 * whose budget is params.maxMemoryPerThread(numThreads). Each sorter is
 * turned into a chunk and the chunks are merged with mergeReaders.
 *
 * If a worker throws, the remaining workers stop at their next partition
 * and the first exception is rethrown here once all have joined.
 *
 * @param creator must be thread-safe (both shipped creators are)
 */
std::unique_ptr<ChunkReader> sortInParallel(const std::vector<std::unique_ptr<ChunkReader>>& partitions,
                                            const PartitionExtractor& extractor,
                                            MergeFunctionPtr mergeFn, const ChunkParameters& params,
                                            size_t numThreads,
                                            std::shared_ptr<ChunkCreator> creator);

}  // namespace extsort
}  // namespace sieve
