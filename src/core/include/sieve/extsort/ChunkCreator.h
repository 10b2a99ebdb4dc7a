// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/store/Directory.h"
#include "sieve/store/IndexInput.h"
#include "sieve/store/IndexOutput.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sieve {
namespace extsort {

/**
 * @brief The bytes of one chunk, wherever they live.
 *
 * Shared by the reader and every cursor of the chunk; the backing file or
 * buffer is released when the last owner goes away.
 */
class ChunkStorage {
public:
    virtual ~ChunkStorage() = default;

    /**
     * @brief Opens a fresh reader positioned at offset 0.
     */
    virtual std::unique_ptr<store::IndexInput> openInput() const = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief A chunk being written: the output to fill and the storage that
 * will hold the bytes once the output is closed.
 */
struct PendingChunk {
    std::unique_ptr<store::IndexOutput> output;
    std::shared_ptr<ChunkStorage> storage;
};

/**
 * @brief Factory for chunk backing stores.
 *
 * Implementations must be thread-safe: parallel sorters share one creator.
 */
class ChunkCreator {
public:
    virtual ~ChunkCreator() = default;

    virtual PendingChunk create() = 0;
};

/**
 * @brief Chunks as temporary files of a directory.
 *
 * Each file is deleted when its storage is destroyed. The directory must
 * outlive every chunk created from it.
 */
class TempFileChunkCreator : public ChunkCreator {
public:
    explicit TempFileChunkCreator(store::Directory& directory, std::string prefix = "chunk")
        : directory_(directory)
        , prefix_(std::move(prefix)) {}

    PendingChunk create() override;

private:
    store::Directory& directory_;
    std::string prefix_;
};

/**
 * @brief Chunks as in-memory byte buffers.
 */
class InMemoryChunkCreator : public ChunkCreator {
public:
    PendingChunk create() override;

private:
    std::atomic<uint64_t> counter_{0};
};

}  // namespace extsort
}  // namespace sieve
