// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/compression/ICompressionCodec.h"

#include <string>

namespace sieve {
namespace compression {

/**
 * No compression codec (identity)
 */
class NoneCodec : public ICompressionCodec {
public:
    std::string getName() const override { return "None"; }

    uint8_t getCodecId() const override { return static_cast<uint8_t>(CodecId::None); }

    size_t compress(const char* source, size_t source_size, char* dest,
                    size_t dest_capacity) const override;

    size_t decompress(const char* source, size_t source_size, char* dest,
                      size_t dest_capacity) const override;

    size_t getMaxCompressedSize(size_t source_size) const override { return source_size; }

    static CompressionCodecPtr create();
};

/**
 * LZ4 compression codec, the "fast" chunk compression.
 *
 * Throws on use when the library was not found at build time (HAVE_LZ4 unset).
 */
class LZ4Codec : public ICompressionCodec {
public:
    std::string getName() const override { return "LZ4"; }

    uint8_t getCodecId() const override { return static_cast<uint8_t>(CodecId::LZ4); }

    size_t compress(const char* source, size_t source_size, char* dest,
                    size_t dest_capacity) const override;

    size_t decompress(const char* source, size_t source_size, char* dest,
                      size_t dest_capacity) const override;

    size_t getMaxCompressedSize(size_t source_size) const override;

    /**
     * Whether the library is compiled in
     */
    static bool isAvailable() noexcept;

    static CompressionCodecPtr create();
};

/**
 * ZSTD compression codec, the "high ratio" chunk compression.
 *
 * Throws on use when the library was not found at build time (HAVE_ZSTD unset).
 */
class ZSTDCodec : public ICompressionCodec {
public:
    static constexpr int DEFAULT_LEVEL = 3;
    static constexpr int MIN_LEVEL = 1;
    static constexpr int MAX_LEVEL = 22;

    /**
     * @throws std::invalid_argument if level is outside 1-22
     */
    explicit ZSTDCodec(int level = DEFAULT_LEVEL);

    std::string getName() const override { return "ZSTD"; }

    uint8_t getCodecId() const override { return static_cast<uint8_t>(CodecId::ZSTD); }

    size_t compress(const char* source, size_t source_size, char* dest,
                    size_t dest_capacity) const override;

    size_t decompress(const char* source, size_t source_size, char* dest,
                      size_t dest_capacity) const override;

    size_t getMaxCompressedSize(size_t source_size) const override;

    int getLevel() const override { return level_; }

    /**
     * Whether the library is compiled in
     */
    static bool isAvailable() noexcept;

    static CompressionCodecPtr create(int level = DEFAULT_LEVEL);

private:
    int level_;
};

/**
 * Codec factory
 */
class CompressionCodecFactory {
public:
    /**
     * @param level Compression level, 0 selects the codec default
     * @throws std::runtime_error for an unknown codec id
     */
    static CompressionCodecPtr getCodecById(uint8_t codec_id, int level = 0);
};

}  // namespace compression
}  // namespace sieve
