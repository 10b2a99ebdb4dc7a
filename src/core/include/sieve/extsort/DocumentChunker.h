// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/Chunk.h"
#include "sieve/extsort/ChunkCreator.h"
#include "sieve/extsort/ChunkParameters.h"

#include <memory>

namespace sieve {
namespace extsort {

/**
 * @brief Splits a chunk into consecutive sub-chunks of bounded size.
 *
 * Sub-chunks come out in key order. Each one is closed as soon as the key
 * and value bytes accumulated into it reach documentsChunkSize, so every
 * sub-chunk but the last holds at least that many bytes. An empty input
 * yields exactly one empty sub-chunk.
 *
 * The sub-chunks are the partitions handed to sortInParallel.
 */
class DocumentChunker {
public:
    static constexpr size_t DEFAULT_DOCUMENTS_CHUNK_SIZE = 4 * 1024 * 1024;

    /**
     * @param source must outlive the chunker
     * @param creator must outlive the chunker
     * @throws std::invalid_argument if documentsChunkSize is 0
     */
    DocumentChunker(const ChunkReader& source, ChunkParameters params, size_t documentsChunkSize,
                    ChunkCreator& creator);

    /**
     * @return the next sub-chunk, or nullptr after the last one
     */
    std::unique_ptr<ChunkReader> next();

private:
    ChunkCursor cursor_;
    ChunkParameters params_;
    size_t documentsChunkSize_;
    ChunkCreator& creator_;

    bool pendingEntry_ = false;
    bool sourceDone_ = false;
    bool emittedAny_ = false;
};

}  // namespace extsort
}  // namespace sieve
