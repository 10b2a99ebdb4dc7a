// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/util/DocIdBitmap.h"

#include "sieve/util/Exceptions.h"

#include <sstream>
#include <stdexcept>

namespace sieve {
namespace util {

DocIdBitmap::DocIdBitmap(std::initializer_list<DocumentId> ids) {
    roaring_.addMany(ids.size(), ids.begin());
}

DocIdBitmap DocIdBitmap::fromUnsorted(const std::vector<DocumentId>& ids) {
    roaring::Roaring roaring;
    roaring.addMany(ids.size(), ids.data());
    return DocIdBitmap(std::move(roaring));
}

DocIdBitmap DocIdBitmap::fromRange(DocumentId first, DocumentId last) {
    roaring::Roaring roaring;
    if (first <= last) {
        // addRange takes a right-open range
        roaring.addRange(first, static_cast<uint64_t>(last) + 1);
    }
    return DocIdBitmap(std::move(roaring));
}

std::optional<DocumentId> DocIdBitmap::min() const noexcept {
    if (roaring_.isEmpty()) {
        return std::nullopt;
    }
    return roaring_.minimum();
}

std::optional<DocumentId> DocIdBitmap::max() const noexcept {
    if (roaring_.isEmpty()) {
        return std::nullopt;
    }
    return roaring_.maximum();
}

std::vector<DocumentId> DocIdBitmap::toVector() const {
    std::vector<DocumentId> ids(roaring_.cardinality());
    roaring_.toUint32Array(ids.data());
    return ids;
}

void DocIdBitmap::serializeInto(Bytes& out) const {
    roaring::Roaring optimized = roaring_;
    optimized.runOptimize();
    const size_t size = optimized.getSizeInBytes(true);
    const size_t offset = out.size();
    out.resize(offset + size);
    optimized.write(reinterpret_cast<char*>(out.data() + offset), true);
}

Bytes DocIdBitmap::serialize() const {
    Bytes out;
    serializeInto(out);
    return out;
}

DocIdBitmap DocIdBitmap::deserialize(ByteSpan bytes) {
    if (bytes.empty()) {
        throw CorruptIndexException("DocIdBitmap: empty encoding");
    }

    roaring::Roaring roaring;
    try {
        roaring = roaring::Roaring::readSafe(reinterpret_cast<const char*>(bytes.data()),
                                             bytes.size());
    } catch (const std::runtime_error& e) {
        throw CorruptIndexException(std::string("DocIdBitmap: invalid portable bitmap (") +
                                    e.what() + ")");
    }
    if (roaring.getSizeInBytes(true) != bytes.size()) {
        throw CorruptIndexException("DocIdBitmap: trailing bytes after bitmap");
    }
    return DocIdBitmap(std::move(roaring));
}

std::string DocIdBitmap::toString() const {
    std::ostringstream oss;
    oss << '[';
    bool first = true;
    for (DocumentId id : roaring_) {
        oss << (first ? "" : ", ") << id;
        first = false;
    }
    oss << ']';
    return oss.str();
}

DocIdBitmap operator&(const DocIdBitmap& a, const DocIdBitmap& b) {
    return DocIdBitmap(a.roaring_ & b.roaring_);
}

DocIdBitmap operator|(const DocIdBitmap& a, const DocIdBitmap& b) {
    return DocIdBitmap(a.roaring_ | b.roaring_);
}

DocIdBitmap operator-(const DocIdBitmap& a, const DocIdBitmap& b) {
    return DocIdBitmap(a.roaring_ - b.roaring_);
}

}  // namespace util
}  // namespace sieve
