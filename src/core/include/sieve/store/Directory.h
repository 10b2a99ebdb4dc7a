// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/store/IndexInput.h"
#include "sieve/store/IndexOutput.h"

#include <atomic>
#include <memory>
#include <string>

namespace sieve {
namespace store {

/**
 * @brief Abstract interface for the directory holding spilled chunk files.
 *
 * Based on: org.apache.lucene.store.Directory
 *
 * Chunks are written once through a temporary output, read back through
 * independent inputs, and deleted when the last reader is gone.
 *
 * Concurrent reads are safe. Creating and deleting files must be externally
 * synchronized per file name; temp names are unique per directory.
 *
 * Usage:
 * ```cpp
 * auto dir = FSDirectory::open("/path/to/tmp");
 * auto output = dir->createTempOutput("facet", ".chunk");
 * output->writeVInt(42);
 * output->close();
 * auto input = dir->openInput(output->getName());
 * ```
 */
class Directory {
public:
    virtual ~Directory() = default;

    // ==================== File Operations ====================

    /**
     * @brief Deletes a file.
     * @throws FileNotFoundException if file doesn't exist
     * @throws IOException on I/O error
     */
    virtual void deleteFile(const std::string& name) = 0;

    [[nodiscard]] virtual bool fileExists(const std::string& name) const = 0;

    // ==================== Stream Creation ====================

    /**
     * @brief Creates a temporary output file.
     *
     * Filename will be: prefix + "_" + unique_id + suffix + ".tmp"
     */
    virtual std::unique_ptr<IndexOutput> createTempOutput(const std::string& prefix,
                                                          const std::string& suffix) = 0;

    /**
     * @brief Opens an input stream for reading.
     * @throws FileNotFoundException if file doesn't exist
     * @throws IOException on I/O error
     */
    virtual std::unique_ptr<IndexInput> openInput(const std::string& name) const = 0;

    // ==================== Lifecycle ====================

    /**
     * @brief Closes the directory. After close(), no operations are allowed.
     */
    virtual void close() = 0;

    [[nodiscard]] bool isClosed() const { return closed_.load(std::memory_order_relaxed); }

    [[nodiscard]] virtual std::string toString() const { return "Directory"; }

protected:
    /**
     * @throws AlreadyClosedException if closed
     */
    void ensureOpen() const;

    std::atomic<bool> closed_{false};
};

}  // namespace store
}  // namespace sieve
