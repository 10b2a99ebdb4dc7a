// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <cstdint>
#include <string>

namespace sieve {
namespace store {

/**
 * @brief Abstract sequential writer for chunk files and document batches.
 *
 * Based on: org.apache.lucene.store.IndexOutput
 *
 * Write-only, no seek. close() must be called to flush and finalize the
 * underlying file; after close() no further writes are allowed.
 *
 * Usage pattern:
 * ```cpp
 * auto output = directory->createTempOutput("facet", ".chunk");
 * output->writeVInt(42);
 * output->close();
 * ```
 */
class IndexOutput {
public:
    virtual ~IndexOutput() = default;

    // ==================== Basic Writing ====================

    /**
     * @brief Writes a single byte.
     * @throws IOException on I/O error
     */
    virtual void writeByte(uint8_t b) = 0;

    /**
     * @brief Writes bytes from a buffer.
     * @throws IOException on I/O error
     */
    virtual void writeBytes(const uint8_t* buffer, size_t length) = 0;

    // ==================== Multi-byte Writes ====================

    /**
     * @brief Writes a 32-bit integer (big-endian).
     */
    virtual void writeInt(int32_t i) {
        writeByte(static_cast<uint8_t>(i >> 24));
        writeByte(static_cast<uint8_t>(i >> 16));
        writeByte(static_cast<uint8_t>(i >> 8));
        writeByte(static_cast<uint8_t>(i));
    }

    /**
     * @brief Writes a 64-bit long (big-endian).
     */
    virtual void writeLong(int64_t l) {
        writeInt(static_cast<int32_t>(l >> 32));
        writeInt(static_cast<int32_t>(l));
    }

    // ==================== Variable-Length Encoding ====================

    /**
     * @brief Writes a variable-length integer (1-5 bytes).
     */
    virtual void writeVInt(int32_t i);

    // ==================== Positioning ====================

    /**
     * @brief Number of bytes written so far.
     */
    virtual int64_t getFilePointer() const = 0;

    // ==================== Finalization ====================

    /**
     * @brief Flushes and finalizes the output. Idempotent.
     * @throws IOException on I/O error
     */
    virtual void close() = 0;

    /**
     * @brief Returns the file name for diagnostic purposes.
     */
    virtual std::string getName() const = 0;

protected:
    IndexOutput() = default;
};

}  // namespace store
}  // namespace sieve
