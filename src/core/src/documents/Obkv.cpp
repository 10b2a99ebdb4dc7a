// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/documents/Obkv.h"

#include "sieve/util/Exceptions.h"
#include "sieve/util/NumericUtils.h"

#include <algorithm>
#include <limits>
#include <map>

namespace sieve {
namespace documents {

using util::NumericUtils;

// ==================== ObkvWriter ====================

void ObkvWriter::insert(FieldId id, ByteSpan value) {
    if (static_cast<int32_t>(id) <= lastId_) {
        throw std::invalid_argument("ObkvWriter: field " + std::to_string(id) +
                                    " inserted after field " + std::to_string(lastId_));
    }
    if (value.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("ObkvWriter: value of field " + std::to_string(id) +
                                    " is too large");
    }

    uint8_t header[obkv_format::FIELD_HEADER_SIZE];
    NumericUtils::shortToBytesBE(id, header);
    NumericUtils::intToBytesBE(static_cast<uint32_t>(value.size()), header + 2);
    buffer_.insert(buffer_.end(), header, header + sizeof(header));
    buffer_.insert(buffer_.end(), value.begin(), value.end());

    lastId_ = id;
    fieldCount_++;
}

Bytes ObkvWriter::take() {
    Bytes out = std::move(buffer_);
    buffer_.clear();
    fieldCount_ = 0;
    lastId_ = -1;
    return out;
}

// ==================== ObkvReader ====================

ObkvReader::ObkvReader(ByteSpan record) {
    size_t pos = 0;
    int32_t lastId = -1;
    while (pos < record.size()) {
        if (record.size() - pos < obkv_format::FIELD_HEADER_SIZE) {
            throw CorruptIndexException("Truncated document record field header at byte " +
                                        std::to_string(pos));
        }
        const FieldId id = NumericUtils::bytesToShortBE(record.data() + pos);
        const uint32_t len = NumericUtils::bytesToIntBE(record.data() + pos + 2);
        pos += obkv_format::FIELD_HEADER_SIZE;
        if (record.size() - pos < len) {
            throw CorruptIndexException("Document record field " + std::to_string(id) +
                                        " overruns the record");
        }
        if (static_cast<int32_t>(id) <= lastId) {
            throw CorruptIndexException("Document record fields out of order at field " +
                                        std::to_string(id));
        }
        fields_.emplace_back(id, record.subspan(pos, len));
        pos += len;
        lastId = id;
    }
}

std::optional<ByteSpan> ObkvReader::get(FieldId id) const {
    auto it = std::lower_bound(fields_.begin(), fields_.end(), id,
                               [](const Field& f, FieldId target) { return f.first < target; });
    if (it == fields_.end() || it->first != id) {
        return std::nullopt;
    }
    return it->second;
}

// ==================== ObkvFieldMerge ====================

Bytes ObkvFieldMerge::merge(ByteSpan /*key*/, const std::vector<ByteSpan>& values) const {
    if (values.empty()) {
        throw std::invalid_argument(getName() + ": merge called without values");
    }
    if (values.size() == 1) {
        return util::toBytes(values.front());
    }

    std::map<FieldId, ByteSpan> merged;
    for (const auto& value : values) {
        ObkvReader reader(value);
        for (const auto& [id, field] : reader.fields()) {
            merged[id] = field;
        }
    }

    ObkvWriter writer;
    for (const auto& [id, field] : merged) {
        writer.insert(id, field);
    }
    return writer.take();
}

extsort::MergeFunctionPtr ObkvFieldMerge::create() {
    return std::make_shared<ObkvFieldMerge>();
}

}  // namespace documents
}  // namespace sieve
