// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace sieve {
namespace compression {

/**
 * ICompressionCodec compresses one block of a chunk stream at a time.
 *
 * Based on: ClickHouse ICompressionCodec
 *
 * Supported codecs:
 * - None: identity
 * - LZ4: fast
 * - ZSTD: high ratio
 */
class ICompressionCodec {
public:
    virtual ~ICompressionCodec() = default;

    /**
     * Codec name (e.g., "LZ4", "ZSTD")
     */
    virtual std::string getName() const = 0;

    /**
     * Codec ID byte, stored in chunk headers
     */
    virtual uint8_t getCodecId() const = 0;

    /**
     * Compress data
     * @param source Source buffer
     * @param source_size Source size in bytes
     * @param dest Destination buffer (at least getMaxCompressedSize(source_size))
     * @param dest_capacity Destination capacity
     * @return Compressed size in bytes
     */
    virtual size_t compress(const char* source, size_t source_size, char* dest,
                            size_t dest_capacity) const = 0;

    /**
     * Decompress data
     * @param source Compressed buffer
     * @param source_size Compressed size
     * @param dest Destination buffer, sized to the original length
     * @param dest_capacity Destination capacity
     * @return Decompressed size in bytes
     */
    virtual size_t decompress(const char* source, size_t source_size, char* dest,
                              size_t dest_capacity) const = 0;

    /**
     * Worst-case compressed size for an input of source_size bytes
     */
    virtual size_t getMaxCompressedSize(size_t source_size) const = 0;

    /**
     * Compression level, 0 when the codec has none
     */
    virtual int getLevel() const { return 0; }
};

using CompressionCodecPtr = std::shared_ptr<const ICompressionCodec>;

/**
 * Codec IDs (for file format)
 */
enum class CodecId : uint8_t {
    None = 0x00,
    LZ4 = 0x01,
    ZSTD = 0x02,
};

}  // namespace compression
}  // namespace sieve
