// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace sieve {
namespace store {

/**
 * @brief Abstract random-access reader over an immutable file.
 *
 * Based on: org.apache.lucene.store.IndexInput
 *
 * Contents never change after creation; only the position moves. clone()
 * gives an independent position over the same bytes, which is how several
 * cursors read one chunk.
 */
class IndexInput {
public:
    virtual ~IndexInput() = default;

    // ==================== Basic Reading ====================

    /**
     * @brief Reads a single byte.
     * @throws EOFException if at end of file
     * @throws IOException on I/O error
     */
    virtual uint8_t readByte() = 0;

    /**
     * @brief Reads exactly length bytes into buffer.
     * @throws EOFException if not enough bytes available
     * @throws IOException on I/O error
     */
    virtual void readBytes(uint8_t* buffer, size_t length) = 0;

    // ==================== Multi-byte Reads ====================

    /**
     * @brief Reads a 32-bit integer (big-endian).
     */
    virtual int32_t readInt() {
        uint32_t value = 0;
        for (int i = 0; i < 4; i++) {
            value = (value << 8) | readByte();
        }
        return static_cast<int32_t>(value);
    }

    /**
     * @brief Reads a 64-bit long (big-endian).
     */
    virtual int64_t readLong() {
        const uint64_t high = static_cast<uint32_t>(readInt());
        const uint64_t low = static_cast<uint32_t>(readInt());
        return static_cast<int64_t>((high << 32) | low);
    }

    // ==================== Variable-Length Encoding ====================

    /**
     * @brief Reads a variable-length integer (1-5 bytes).
     * @throws IOException on invalid encoding
     */
    virtual int32_t readVInt();

    // ==================== Positioning ====================

    virtual int64_t getFilePointer() const = 0;

    /**
     * @brief Seeks to an absolute position.
     * @throws IOException if pos is outside [0, length()]
     */
    virtual void seek(int64_t pos) = 0;

    virtual int64_t length() const = 0;

    /**
     * @brief Returns the file name for diagnostic purposes.
     */
    virtual std::string toString() const { return "IndexInput"; }

    // ==================== Cloning ====================

    /**
     * @brief Creates an independent reader over the same bytes, positioned
     * where this one is.
     */
    virtual std::unique_ptr<IndexInput> clone() const = 0;

protected:
    IndexInput() = default;
};

}  // namespace store
}  // namespace sieve
