// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/compression/CompressionCodecs.h"

#include <cstring>
#include <limits>
#include <stdexcept>

#ifdef HAVE_LZ4
#    include <lz4.h>
#endif

#ifdef HAVE_ZSTD
#    include <zstd.h>
#endif

namespace sieve {
namespace compression {

// ==================== NoneCodec ====================

size_t NoneCodec::compress(const char* source, size_t source_size, char* dest,
                           size_t dest_capacity) const {
    if (dest_capacity < source_size) {
        throw std::runtime_error("NoneCodec: destination buffer too small");
    }
    if (source_size > 0) {
        std::memcpy(dest, source, source_size);
    }
    return source_size;
}

size_t NoneCodec::decompress(const char* source, size_t source_size, char* dest,
                             size_t dest_capacity) const {
    if (dest_capacity < source_size) {
        throw std::runtime_error("NoneCodec: destination buffer too small");
    }
    if (source_size > 0) {
        std::memcpy(dest, source, source_size);
    }
    return source_size;
}

CompressionCodecPtr NoneCodec::create() {
    return std::make_shared<NoneCodec>();
}

// ==================== LZ4Codec ====================

size_t LZ4Codec::compress(const char* source, size_t source_size, char* dest,
                          size_t dest_capacity) const {
#ifdef HAVE_LZ4
    if (source_size == 0) {
        return 0;
    }
    if (source_size > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        dest_capacity > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("LZ4Codec: buffer size too large");
    }

    int compressed_size = LZ4_compress_default(source, dest, static_cast<int>(source_size),
                                               static_cast<int>(dest_capacity));
    if (compressed_size <= 0) {
        throw std::runtime_error("LZ4Codec: compression failed");
    }
    return static_cast<size_t>(compressed_size);
#else
    (void)source;
    (void)source_size;
    (void)dest;
    (void)dest_capacity;
    throw std::runtime_error("LZ4Codec: LZ4 library not available");
#endif
}

size_t LZ4Codec::decompress(const char* source, size_t source_size, char* dest,
                            size_t dest_capacity) const {
#ifdef HAVE_LZ4
    if (source_size == 0) {
        return 0;
    }
    if (source_size > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        dest_capacity > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("LZ4Codec: buffer size too large");
    }

    int decompressed_size = LZ4_decompress_safe(source, dest, static_cast<int>(source_size),
                                                static_cast<int>(dest_capacity));
    if (decompressed_size < 0) {
        throw std::runtime_error("LZ4Codec: decompression failed");
    }
    return static_cast<size_t>(decompressed_size);
#else
    (void)source;
    (void)source_size;
    (void)dest;
    (void)dest_capacity;
    throw std::runtime_error("LZ4Codec: LZ4 library not available");
#endif
}

size_t LZ4Codec::getMaxCompressedSize(size_t source_size) const {
#ifdef HAVE_LZ4
    if (source_size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("LZ4Codec: source size too large");
    }
    return static_cast<size_t>(LZ4_compressBound(static_cast<int>(source_size)));
#else
    return source_size + (source_size / 255) + 16;
#endif
}

bool LZ4Codec::isAvailable() noexcept {
#ifdef HAVE_LZ4
    return true;
#else
    return false;
#endif
}

CompressionCodecPtr LZ4Codec::create() {
    return std::make_shared<LZ4Codec>();
}

// ==================== ZSTDCodec ====================

ZSTDCodec::ZSTDCodec(int level)
    : level_(level) {
    if (level < MIN_LEVEL || level > MAX_LEVEL) {
        throw std::invalid_argument("ZSTDCodec: invalid compression level (must be 1-22)");
    }
}

size_t ZSTDCodec::compress(const char* source, size_t source_size, char* dest,
                           size_t dest_capacity) const {
#ifdef HAVE_ZSTD
    if (source_size == 0) {
        return 0;
    }

    size_t compressed_size = ZSTD_compress(dest, dest_capacity, source, source_size, level_);
    if (ZSTD_isError(compressed_size)) {
        throw std::runtime_error(std::string("ZSTDCodec: compression failed: ") +
                                 ZSTD_getErrorName(compressed_size));
    }
    return compressed_size;
#else
    (void)source;
    (void)source_size;
    (void)dest;
    (void)dest_capacity;
    throw std::runtime_error("ZSTDCodec: ZSTD library not available");
#endif
}

size_t ZSTDCodec::decompress(const char* source, size_t source_size, char* dest,
                             size_t dest_capacity) const {
#ifdef HAVE_ZSTD
    if (source_size == 0) {
        return 0;
    }

    size_t decompressed_size = ZSTD_decompress(dest, dest_capacity, source, source_size);
    if (ZSTD_isError(decompressed_size)) {
        throw std::runtime_error(std::string("ZSTDCodec: decompression failed: ") +
                                 ZSTD_getErrorName(decompressed_size));
    }
    return decompressed_size;
#else
    (void)source;
    (void)source_size;
    (void)dest;
    (void)dest_capacity;
    throw std::runtime_error("ZSTDCodec: ZSTD library not available");
#endif
}

size_t ZSTDCodec::getMaxCompressedSize(size_t source_size) const {
#ifdef HAVE_ZSTD
    return ZSTD_compressBound(source_size);
#else
    return source_size + (source_size / 255) + 16;
#endif
}

bool ZSTDCodec::isAvailable() noexcept {
#ifdef HAVE_ZSTD
    return true;
#else
    return false;
#endif
}

CompressionCodecPtr ZSTDCodec::create(int level) {
    return std::make_shared<ZSTDCodec>(level);
}

// ==================== Factory ====================

CompressionCodecPtr CompressionCodecFactory::getCodecById(uint8_t codec_id, int level) {
    switch (static_cast<CodecId>(codec_id)) {
        case CodecId::None:
            return NoneCodec::create();
        case CodecId::LZ4:
            return LZ4Codec::create();
        case CodecId::ZSTD:
            return ZSTDCodec::create(level == 0 ? ZSTDCodec::DEFAULT_LEVEL : level);
        default:
            throw std::runtime_error("Unknown compression codec ID: " + std::to_string(codec_id));
    }
}

}  // namespace compression
}  // namespace sieve
