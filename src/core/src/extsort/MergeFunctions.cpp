// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/MergeFunctions.h"

#include "sieve/util/DocIdBitmap.h"
#include "sieve/util/Exceptions.h"

#include <sstream>

namespace sieve {
namespace extsort {

namespace {

std::string describeKey(ByteSpan key) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < key.size() && i < 32; i++) {
        oss << (i > 0 ? " " : "") << static_cast<int>(key[i]);
    }
    if (key.size() > 32) {
        oss << " ...";
    }
    oss << "]";
    return oss.str();
}

void requireValues(const MergeFunction& fn, const std::vector<ByteSpan>& values) {
    if (values.empty()) {
        throw std::invalid_argument(fn.getName() + ": merge called without values");
    }
}

}  // namespace

// ==================== KeepLatestMerge ====================

Bytes KeepLatestMerge::merge(ByteSpan /*key*/, const std::vector<ByteSpan>& values) const {
    requireValues(*this, values);
    return util::toBytes(values.back());
}

MergeFunctionPtr KeepLatestMerge::create() {
    return std::make_shared<KeepLatestMerge>();
}

// ==================== KeepFirstMerge ====================

Bytes KeepFirstMerge::merge(ByteSpan /*key*/, const std::vector<ByteSpan>& values) const {
    requireValues(*this, values);
    return util::toBytes(values.front());
}

MergeFunctionPtr KeepFirstMerge::create() {
    return std::make_shared<KeepFirstMerge>();
}

// ==================== RequireIdenticalMerge ====================

Bytes RequireIdenticalMerge::merge(ByteSpan key, const std::vector<ByteSpan>& values) const {
    requireValues(*this, values);
    for (size_t i = 1; i < values.size(); i++) {
        if (!util::bytesEqual(values[0], values[i])) {
            throw MergeConflictException("Conflicting values for key " + describeKey(key) +
                                         " (" + std::to_string(values.size()) + " values)");
        }
    }
    return util::toBytes(values.front());
}

MergeFunctionPtr RequireIdenticalMerge::create() {
    return std::make_shared<RequireIdenticalMerge>();
}

// ==================== UnionBitmapMerge ====================

Bytes UnionBitmapMerge::merge(ByteSpan /*key*/, const std::vector<ByteSpan>& values) const {
    requireValues(*this, values);
    util::DocIdBitmap merged;
    for (const auto& value : values) {
        merged |= util::DocIdBitmap::deserialize(value);
    }
    return merged.serialize();
}

MergeFunctionPtr UnionBitmapMerge::create() {
    return std::make_shared<UnionBitmapMerge>();
}

}  // namespace extsort
}  // namespace sieve
