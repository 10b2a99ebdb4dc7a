// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <cstdint>
#include <cstring>

namespace sieve {
namespace util {

/**
 * @brief Helper functions to encode numeric values as byte-comparable bytes.
 *
 * Based on: org.apache.lucene.util.NumericUtils
 *
 * Used for:
 * - Field ids and document ids in persisted keys (big-endian)
 * - Floating-point facet bounds, so that memcmp order equals numeric order
 *
 * Sort order semantics for doubles:
 * - Negative numbers < Zero < Positive numbers
 * - -0.0 is normalized to 0.0 so both encode to the same key
 * - NaN sorts after positive infinity
 */
class NumericUtils {
public:
    // No instances
    NumericUtils() = delete;

    /**
     * @brief Converts a double to an unsigned 64-bit value whose unsigned
     * order matches the numeric order of the input.
     *
     * Algorithm:
     * - Sign bit clear (positive): set the sign bit
     * - Sign bit set (negative): flip every bit
     */
    [[nodiscard]] static uint64_t doubleToSortableBits(double value) noexcept;

    /**
     * @brief Inverse of doubleToSortableBits.
     */
    [[nodiscard]] static double sortableBitsToDouble(uint64_t encoded) noexcept;

    static void shortToBytesBE(uint16_t value, uint8_t* dest) noexcept;

    static void intToBytesBE(uint32_t value, uint8_t* dest) noexcept;

    static void longToBytesBE(uint64_t value, uint8_t* dest) noexcept;

    [[nodiscard]] static uint16_t bytesToShortBE(const uint8_t* src) noexcept;

    [[nodiscard]] static uint32_t bytesToIntBE(const uint8_t* src) noexcept;

    [[nodiscard]] static uint64_t bytesToLongBE(const uint8_t* src) noexcept;

    /**
     * @brief Writes doubleToSortableBits(value) as 8 big-endian bytes.
     * @param dest Output buffer (must have at least 8 bytes)
     */
    static void doubleToBytesBE(double value, uint8_t* dest) noexcept;

    /**
     * @brief Reads 8 bytes produced by doubleToBytesBE.
     * @param src Source buffer (must have at least 8 bytes)
     */
    [[nodiscard]] static double bytesToDoubleBE(const uint8_t* src) noexcept;
};

}  // namespace util
}  // namespace sieve
