// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/facet/FacetBoundCodecs.h"

#include "sieve/util/Exceptions.h"
#include "sieve/util/NumericUtils.h"

#include <cmath>

namespace sieve {
namespace facet {

using util::NumericUtils;

util::Bytes OrderedF64Codec::encode(double value) {
    if (std::isnan(value)) {
        throw std::invalid_argument("NaN cannot be used as a facet value");
    }
    util::Bytes out(ENCODED_SIZE);
    NumericUtils::longToBytesBE(NumericUtils::doubleToSortableBits(value), out.data());
    return out;
}

double OrderedF64Codec::decode(util::ByteSpan bytes) {
    if (bytes.size() != ENCODED_SIZE) {
        throw CorruptIndexException("f64 bound must be 8 bytes, got " +
                                    std::to_string(bytes.size()));
    }
    return NumericUtils::sortableBitsToDouble(NumericUtils::bytesToLongBE(bytes.data()));
}

util::Bytes OrderedU32Codec::encode(uint32_t value) {
    util::Bytes out(ENCODED_SIZE);
    NumericUtils::intToBytesBE(value, out.data());
    return out;
}

uint32_t OrderedU32Codec::decode(util::ByteSpan bytes) {
    if (bytes.size() != ENCODED_SIZE) {
        throw CorruptIndexException("u32 bound must be 4 bytes, got " +
                                    std::to_string(bytes.size()));
    }
    return NumericUtils::bytesToIntBE(bytes.data());
}

}  // namespace facet
}  // namespace sieve
