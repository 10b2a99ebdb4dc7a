// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sieve {
namespace util {

/** Owned byte string (keys, values, encoded bounds). */
using Bytes = std::vector<uint8_t>;

/** Borrowed view over bytes owned by someone else. */
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Lexicographic byte comparison, shorter prefix first.
 * @return negative, zero or positive like memcmp
 */
inline int compareBytes(ByteSpan a, ByteSpan b) noexcept {
    const size_t common = std::min(a.size(), b.size());
    if (common > 0) {
        const int cmp = std::memcmp(a.data(), b.data(), common);
        if (cmp != 0) {
            return cmp;
        }
    }
    if (a.size() == b.size()) {
        return 0;
    }
    return a.size() < b.size() ? -1 : 1;
}

inline bool bytesEqual(ByteSpan a, ByteSpan b) noexcept {
    return a.size() == b.size() && compareBytes(a, b) == 0;
}

inline Bytes toBytes(ByteSpan span) {
    return Bytes(span.begin(), span.end());
}

inline Bytes toBytes(std::string_view text) {
    return Bytes(reinterpret_cast<const uint8_t*>(text.data()),
                 reinterpret_cast<const uint8_t*>(text.data()) + text.size());
}

inline ByteSpan asSpan(std::string_view text) noexcept {
    return ByteSpan(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

inline std::string toString(ByteSpan span) {
    return std::string(reinterpret_cast<const char*>(span.data()), span.size());
}

/**
 * Transparent ordering for ordered containers keyed by Bytes, so lookups can
 * be done with a ByteSpan without materializing a key.
 */
struct BytesLess {
    using is_transparent = void;

    bool operator()(ByteSpan a, ByteSpan b) const noexcept { return compareBytes(a, b) < 0; }
};

}  // namespace util
}  // namespace sieve
