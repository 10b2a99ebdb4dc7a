// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/facet/FacetGroup.h"

#include "sieve/util/Exceptions.h"
#include "sieve/util/NumericUtils.h"

#include <algorithm>

namespace sieve {
namespace facet {

using util::NumericUtils;

// ==================== FacetGroupKey ====================

Bytes FacetGroupKey::encode(FieldId fieldId, uint8_t level, ByteSpan leftBound) {
    Bytes out(PREFIX_SIZE + leftBound.size());
    NumericUtils::shortToBytesBE(fieldId, out.data());
    out[2] = level;
    std::copy(leftBound.begin(), leftBound.end(), out.begin() + PREFIX_SIZE);
    return out;
}

FacetGroupKey FacetGroupKey::decode(ByteSpan bytes) {
    auto view = FacetGroupKeyView::decode(bytes);
    return FacetGroupKey{view.fieldId, view.level, util::toBytes(view.leftBound)};
}

FacetGroupKeyView FacetGroupKeyView::decode(ByteSpan bytes) {
    if (bytes.size() < FacetGroupKey::PREFIX_SIZE) {
        throw CorruptIndexException("Facet key too short: " + std::to_string(bytes.size()) +
                                    " bytes");
    }
    return FacetGroupKeyView{NumericUtils::bytesToShortBE(bytes.data()), bytes[2],
                             bytes.subspan(FacetGroupKey::PREFIX_SIZE)};
}

// ==================== FacetGroupValue ====================

Bytes FacetGroupValue::encode() const {
    Bytes out;
    out.push_back(size);
    bitmap.serializeInto(out);
    return out;
}

FacetGroupValue FacetGroupValue::decode(ByteSpan bytes) {
    if (bytes.empty()) {
        throw CorruptIndexException("Empty facet group value");
    }
    return FacetGroupValue{bytes[0], DocIdBitmap::deserialize(bytes.subspan(1))};
}

// ==================== FacetGroupValueMerge ====================

Bytes FacetGroupValueMerge::merge(ByteSpan /*key*/, const std::vector<ByteSpan>& values) const {
    if (values.empty()) {
        throw std::invalid_argument("facet-group-value: merge called without values");
    }
    FacetGroupValue merged{0, DocIdBitmap()};
    for (const auto& bytes : values) {
        auto value = FacetGroupValue::decode(bytes);
        // UNBOUNDED_SIZE is the largest u8, so max keeps it
        merged.size = std::max(merged.size, value.size);
        merged.bitmap |= value.bitmap;
    }
    return merged.encode();
}

extsort::MergeFunctionPtr FacetGroupValueMerge::create() {
    return std::make_shared<FacetGroupValueMerge>();
}

}  // namespace facet
}  // namespace sieve
