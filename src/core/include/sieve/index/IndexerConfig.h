// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/Chunk.h"
#include "sieve/extsort/ChunkCreator.h"
#include "sieve/extsort/ChunkParameters.h"
#include "sieve/extsort/DocumentChunker.h"
#include "sieve/extsort/MergeFunction.h"
#include "sieve/extsort/Sorter.h"
#include "sieve/facet/FacetLevelsBuilder.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace sieve {
namespace index {

/**
 * Configuration of a bulk load
 *
 * Based on: org.apache.lucene.index.IndexWriterConfig
 *
 * Setters chain:
 * ```cpp
 * IndexerConfig config;
 * config.setMaxMemory(512 * 1024 * 1024).setThreadCount(4).setVerbose(true);
 * ```
 */
class IndexerConfig {
public:
    IndexerConfig() = default;

    // ==================== Memory ====================

    /**
     * Total sorter memory of a load, split evenly between threads
     * (default: unset, each sorter uses SorterOptions::DEFAULT_DUMP_THRESHOLD)
     */
    IndexerConfig& setMaxMemory(std::optional<size_t> bytes);

    std::optional<size_t> getMaxMemory() const { return maxMemory_; }

    /**
     * Chunk count at which a sorter compacts (default: unset, unlimited)
     */
    IndexerConfig& setMaxNbChunks(std::optional<size_t> chunks);

    std::optional<size_t> getMaxNbChunks() const { return maxNbChunks_; }

    // ==================== Chunks ====================

    IndexerConfig& setChunkCompression(extsort::ChunkCompression compression) {
        chunkCompression_ = compression;
        return *this;
    }

    extsort::ChunkCompression getChunkCompression() const { return chunkCompression_; }

    /**
     * ZSTD level for ChunkCompression::High (default: 0, the codec default)
     */
    IndexerConfig& setChunkCompressionLevel(int level);

    int getChunkCompressionLevel() const { return chunkCompressionLevel_; }

    /**
     * Bytes of documents handed to one extraction task (default: 4 MiB)
     */
    IndexerConfig& setDocumentsChunkSize(size_t bytes);

    size_t getDocumentsChunkSize() const { return documentsChunkSize_; }

    // ==================== Threads ====================

    /**
     * Extraction threads (default: 1)
     */
    IndexerConfig& setThreadCount(size_t threads);

    size_t getThreadCount() const { return threadCount_; }

    // ==================== Facet Levels ====================

    IndexerConfig& setFacetGroupSize(uint8_t groupSize);

    uint8_t getFacetGroupSize() const { return facetGroupSize_; }

    IndexerConfig& setFacetMinLevelSize(uint8_t minLevelSize);

    uint8_t getFacetMinLevelSize() const { return facetMinLevelSize_; }

    // ==================== Diagnostics ====================

    /**
     * Log sorter spills and load progress to stderr (default: false)
     */
    IndexerConfig& setVerbose(bool verbose) {
        verbose_ = verbose;
        return *this;
    }

    bool isVerbose() const { return verbose_; }

    // ==================== Factories ====================

    [[nodiscard]] extsort::ChunkParameters chunkParameters() const;

    /**
     * Options of a single-threaded sorter using the whole memory budget
     */
    [[nodiscard]] extsort::SorterOptions sorterOptions(
        std::shared_ptr<extsort::ChunkCreator> creator) const;

    [[nodiscard]] extsort::Sorter createSorter(extsort::MergeFunctionPtr mergeFn,
                                               std::shared_ptr<extsort::ChunkCreator> creator) const;

    [[nodiscard]] facet::FacetLevelsBuilder levelsBuilder() const;

private:
    std::optional<size_t> maxMemory_;
    std::optional<size_t> maxNbChunks_;
    extsort::ChunkCompression chunkCompression_{extsort::ChunkCompression::None};
    int chunkCompressionLevel_{0};
    size_t documentsChunkSize_{extsort::DocumentChunker::DEFAULT_DOCUMENTS_CHUNK_SIZE};
    size_t threadCount_{1};
    uint8_t facetGroupSize_{facet::FacetLevelsBuilder::DEFAULT_GROUP_SIZE};
    uint8_t facetMinLevelSize_{facet::FacetLevelsBuilder::DEFAULT_MIN_LEVEL_SIZE};
    bool verbose_{false};
};

}  // namespace index
}  // namespace sieve
