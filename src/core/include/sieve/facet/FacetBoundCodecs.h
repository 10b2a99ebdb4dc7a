// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/util/Bytes.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace sieve {
namespace facet {

/**
 * Order-preserving encodings of facet values into left bounds: for every
 * codec, a < b  <=>  encode(a) < encode(b) bytewise.
 */

/**
 * @brief Doubles as 8 sortable big-endian bytes; -0.0 encodes as 0.0.
 */
struct OrderedF64Codec {
    static constexpr size_t ENCODED_SIZE = 8;

    /**
     * @throws std::invalid_argument for NaN
     */
    static util::Bytes encode(double value);

    /**
     * @throws CorruptIndexException if bytes is not 8 bytes long
     */
    static double decode(util::ByteSpan bytes);
};

/**
 * @brief Unsigned 32-bit integers as 4 big-endian bytes.
 */
struct OrderedU32Codec {
    static constexpr size_t ENCODED_SIZE = 4;

    static util::Bytes encode(uint32_t value);

    /**
     * @throws CorruptIndexException if bytes is not 4 bytes long
     */
    static uint32_t decode(util::ByteSpan bytes);
};

/**
 * @brief Strings as their raw UTF-8 bytes.
 */
struct StringBoundCodec {
    static util::Bytes encode(std::string_view value) { return util::toBytes(value); }

    static std::string decode(util::ByteSpan bytes) { return util::toString(bytes); }
};

}  // namespace facet
}  // namespace sieve
