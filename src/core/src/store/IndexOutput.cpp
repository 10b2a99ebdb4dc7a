// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/store/IndexOutput.h"

namespace sieve {
namespace store {

void IndexOutput::writeVInt(int32_t i) {
    uint32_t ui = static_cast<uint32_t>(i);
    while ((ui & ~0x7FU) != 0) {
        writeByte(static_cast<uint8_t>((ui & 0x7F) | 0x80));
        ui >>= 7;
    }
    writeByte(static_cast<uint8_t>(ui));
}

}  // namespace store
}  // namespace sieve
