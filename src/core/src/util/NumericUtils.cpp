// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/util/NumericUtils.h"

#include <bit>
#include <cstring>

#if defined(__GNUC__) || defined(__clang__)
#define bswap_16(x) __builtin_bswap16(x)
#define bswap_32(x) __builtin_bswap32(x)
#define bswap_64(x) __builtin_bswap64(x)
#else
static inline uint16_t bswap_16(uint16_t x) {
    return static_cast<uint16_t>((x << 8) | (x >> 8));
}

static inline uint32_t bswap_32(uint32_t x) {
    return ((x & 0x000000FFU) << 24) | ((x & 0x0000FF00U) << 8) |
           ((x & 0x00FF0000U) >> 8) | ((x & 0xFF000000U) >> 24);
}

static inline uint64_t bswap_64(uint64_t x) {
    return (static_cast<uint64_t>(bswap_32(static_cast<uint32_t>(x))) << 32) |
           bswap_32(static_cast<uint32_t>(x >> 32));
}
#endif

namespace sieve {
namespace util {

namespace {

constexpr uint64_t SIGN_BIT = 0x8000000000000000ULL;

}  // anonymous namespace

uint64_t NumericUtils::doubleToSortableBits(double value) noexcept {
    if (value == 0.0) {
        value = 0.0;  // folds -0.0 onto +0.0
    }
    const uint64_t bits = std::bit_cast<uint64_t>(value);
    if ((bits & SIGN_BIT) != 0) {
        return ~bits;
    }
    return bits | SIGN_BIT;
}

double NumericUtils::sortableBitsToDouble(uint64_t encoded) noexcept {
    uint64_t bits;
    if ((encoded & SIGN_BIT) != 0) {
        bits = encoded & ~SIGN_BIT;
    } else {
        bits = ~encoded;
    }
    return std::bit_cast<double>(bits);
}

void NumericUtils::shortToBytesBE(uint16_t value, uint8_t* dest) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        value = bswap_16(value);
    }
    std::memcpy(dest, &value, sizeof(value));
}

void NumericUtils::intToBytesBE(uint32_t value, uint8_t* dest) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        value = bswap_32(value);
    }
    std::memcpy(dest, &value, sizeof(value));
}

void NumericUtils::longToBytesBE(uint64_t value, uint8_t* dest) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        value = bswap_64(value);
    }
    std::memcpy(dest, &value, sizeof(value));
}

uint16_t NumericUtils::bytesToShortBE(const uint8_t* src) noexcept {
    uint16_t value;
    std::memcpy(&value, src, sizeof(value));
    if constexpr (std::endian::native == std::endian::little) {
        value = bswap_16(value);
    }
    return value;
}

uint32_t NumericUtils::bytesToIntBE(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    if constexpr (std::endian::native == std::endian::little) {
        value = bswap_32(value);
    }
    return value;
}

uint64_t NumericUtils::bytesToLongBE(const uint8_t* src) noexcept {
    uint64_t value;
    std::memcpy(&value, src, sizeof(value));
    if constexpr (std::endian::native == std::endian::little) {
        value = bswap_64(value);
    }
    return value;
}

void NumericUtils::doubleToBytesBE(double value, uint8_t* dest) noexcept {
    longToBytesBE(doubleToSortableBits(value), dest);
}

double NumericUtils::bytesToDoubleBE(const uint8_t* src) noexcept {
    return sortableBitsToDouble(bytesToLongBE(src));
}

}  // namespace util
}  // namespace sieve
