// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/util/Bytes.h"
#include "sieve/util/Exceptions.h"

#include <cstdint>

namespace sieve {
namespace util {

/**
 * VByte (Variable Byte) encoding for unsigned integers
 *
 * 7 bits per byte, high bit set on every byte but the last:
 * - [0, 127] → 1 byte
 * - [128, 16383] → 2 bytes
 * - [16384, 2097151] → 3 bytes
 *
 * Used for chunk block layouts and the batch field index.
 * Decoding is bounds checked since the input comes from disk.
 */
class VByte {
public:
    static void appendUInt32(Bytes& out, uint32_t value) {
        while (value >= 0x80) {
            out.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
            value >>= 7;
        }
        out.push_back(static_cast<uint8_t>(value));
    }

    static void appendUInt64(Bytes& out, uint64_t value) {
        while (value >= 0x80) {
            out.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
            value >>= 7;
        }
        out.push_back(static_cast<uint8_t>(value));
    }

    /**
     * Decode an unsigned 32-bit integer starting at pos, advancing pos.
     * @throws CorruptIndexException on truncated or over-long input
     */
    static uint32_t readUInt32(ByteSpan input, size_t& pos) {
        uint32_t value = 0;
        for (int shift = 0; shift <= 28; shift += 7) {
            if (pos >= input.size()) {
                throw CorruptIndexException("VByte: truncated input");
            }
            const uint8_t byte = input[pos++];
            if (shift == 28 && (byte & 0xF0) != 0) {
                throw CorruptIndexException("VByte: value does not fit in 32 bits");
            }
            value |= static_cast<uint32_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) {
                return value;
            }
        }
        throw CorruptIndexException("VByte: value does not fit in 32 bits");
    }

    /**
     * Decode an unsigned 64-bit integer starting at pos, advancing pos.
     * @throws CorruptIndexException on truncated or over-long input
     */
    static uint64_t readUInt64(ByteSpan input, size_t& pos) {
        uint64_t value = 0;
        for (int shift = 0; shift < 64; shift += 7) {
            if (pos >= input.size()) {
                throw CorruptIndexException("VByte: truncated input");
            }
            const uint8_t byte = input[pos++];
            value |= static_cast<uint64_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) {
                return value;
            }
        }
        throw CorruptIndexException("VByte: value does not fit in 64 bits");
    }

    /**
     * Calculate encoded size for uint32
     */
    static int encodedSize(uint32_t value) {
        int bytes = 1;
        while (value >= 0x80) {
            bytes++;
            value >>= 7;
        }
        return bytes;
    }
};

}  // namespace util
}  // namespace sieve
