// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/store/IndexInput.h"

#include "sieve/util/Exceptions.h"

namespace sieve {
namespace store {

int32_t IndexInput::readVInt() {
    uint32_t value = 0;
    for (int shift = 0; shift < 35; shift += 7) {
        const uint8_t b = readByte();
        if (shift == 28 && (b & 0xF0) != 0) {
            throw IOException("Invalid VInt encoding: too many bytes");
        }
        value |= static_cast<uint32_t>(b & 0x7F) << shift;
        if ((b & 0x80) == 0) {
            return static_cast<int32_t>(value);
        }
    }
    throw IOException("Invalid VInt encoding: too many bytes");
}

}  // namespace store
}  // namespace sieve
