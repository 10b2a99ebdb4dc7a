// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/documents/DocumentsBatch.h"

#include "sieve/util/Exceptions.h"
#include "sieve/util/NumericUtils.h"
#include "sieve/util/VByte.h"

#include <limits>

namespace sieve {
namespace documents {

using util::NumericUtils;
using util::VByte;

// ==================== DocumentsBatchIndex ====================

FieldId DocumentsBatchIndex::insert(const std::string& name) {
    auto it = ids_.find(name);
    if (it != ids_.end()) {
        return it->second;
    }
    if (names_.size() > std::numeric_limits<FieldId>::max()) {
        throw std::invalid_argument("Too many fields in documents batch, cannot add \"" + name +
                                    "\"");
    }
    const auto id = static_cast<FieldId>(names_.size());
    names_.push_back(name);
    ids_.emplace(name, id);
    return id;
}

std::optional<FieldId> DocumentsBatchIndex::id(const std::string& name) const {
    auto it = ids_.find(name);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> DocumentsBatchIndex::name(FieldId id) const {
    if (id >= names_.size()) {
        return std::nullopt;
    }
    return names_[id];
}

Bytes DocumentsBatchIndex::serialize() const {
    Bytes out;
    VByte::appendUInt32(out, static_cast<uint32_t>(names_.size()));
    for (size_t i = 0; i < names_.size(); i++) {
        uint8_t id[2];
        NumericUtils::shortToBytesBE(static_cast<uint16_t>(i), id);
        out.insert(out.end(), id, id + 2);
        VByte::appendUInt32(out, static_cast<uint32_t>(names_[i].size()));
        out.insert(out.end(), names_[i].begin(), names_[i].end());
    }
    return out;
}

DocumentsBatchIndex DocumentsBatchIndex::deserialize(ByteSpan bytes) {
    DocumentsBatchIndex index;
    size_t pos = 0;
    const uint32_t count = VByte::readUInt32(bytes, pos);
    for (uint32_t i = 0; i < count; i++) {
        if (bytes.size() - pos < 2) {
            throw CorruptIndexException("Truncated field id in documents batch index");
        }
        const FieldId id = NumericUtils::bytesToShortBE(bytes.data() + pos);
        pos += 2;
        const uint32_t len = VByte::readUInt32(bytes, pos);
        if (bytes.size() - pos < len) {
            throw CorruptIndexException("Truncated field name in documents batch index");
        }
        std::string name(reinterpret_cast<const char*>(bytes.data() + pos), len);
        pos += len;
        if (id != index.names_.size() || index.ids_.count(name) != 0) {
            throw CorruptIndexException("Documents batch index is not dense at field \"" + name +
                                        "\"");
        }
        index.insert(name);
    }
    if (pos != bytes.size()) {
        throw CorruptIndexException("Trailing bytes after documents batch index");
    }
    return index;
}

// ==================== DocumentsBatchBuilder ====================

DocumentsBatchBuilder::DocumentsBatchBuilder(store::IndexOutput& output,
                                             extsort::ChunkCompression compression)
    : writer_(output, compression) {}

void DocumentsBatchBuilder::appendDocument(const FieldValues& fields) {
    std::map<FieldId, const std::string*> byId;
    for (const auto& [name, value] : fields) {
        byId[index_.insert(name)] = &value;
    }

    ObkvWriter record;
    for (const auto& [id, value] : byId) {
        record.insert(id, util::asSpan(*value));
    }
    appendRecord(record.bytes());
}

void DocumentsBatchBuilder::appendRecord(ByteSpan record) {
    if (documentsCount_ >= std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Documents batch is full");
    }
    uint8_t key[batch_format::DOCUMENT_KEY_SIZE];
    NumericUtils::intToBytesBE(static_cast<uint32_t>(documentsCount_), key);
    writer_.insert(ByteSpan(key, sizeof(key)), record);
    documentsCount_++;
}

uint64_t DocumentsBatchBuilder::finish() {
    const Bytes index = index_.serialize();
    writer_.insert(ByteSpan(batch_format::INDEX_KEY, sizeof(batch_format::INDEX_KEY)), index);
    writer_.finish();
    return documentsCount_;
}

// ==================== DocumentsBatchCursor ====================

bool DocumentsBatchCursor::next() {
    if (read_ >= documentsCount_ || !cursor_.moveOnNext()) {
        return false;
    }
    if (cursor_.key().size() != batch_format::DOCUMENT_KEY_SIZE) {
        throw CorruptIndexException("Unexpected key of " + std::to_string(cursor_.key().size()) +
                                    " bytes in documents batch");
    }
    position_ = NumericUtils::bytesToIntBE(cursor_.key().data());
    read_++;
    return true;
}

// ==================== DocumentsBatchReader ====================

DocumentsBatchReader::DocumentsBatchReader(std::unique_ptr<extsort::ChunkReader> chunk)
    : chunk_(std::move(chunk)) {
    if (!chunk_) {
        throw std::invalid_argument("DocumentsBatchReader requires a chunk");
    }
    if (chunk_->isEmpty()) {
        throw CorruptIndexException("Documents batch without field index");
    }

    // The index is the last entry; the chunk format only reads forward.
    auto cursor = chunk_->cursor();
    uint64_t seen = 0;
    while (cursor.moveOnNext()) {
        seen++;
        if (seen == chunk_->entryCount()) {
            const ByteSpan indexKey(batch_format::INDEX_KEY, sizeof(batch_format::INDEX_KEY));
            if (!util::bytesEqual(cursor.key(), indexKey)) {
                throw CorruptIndexException("Documents batch does not end with its field index");
            }
            index_ = DocumentsBatchIndex::deserialize(cursor.value());
        }
    }
    documentsCount_ = chunk_->entryCount() - 1;
}

DocumentsBatchReader::DocumentsBatchReader(std::unique_ptr<store::IndexInput> input)
    : DocumentsBatchReader(std::make_unique<extsort::ChunkReader>(std::move(input))) {}

DocumentsBatchCursor DocumentsBatchReader::cursor() const {
    return DocumentsBatchCursor(chunk_->cursor(), documentsCount_);
}

DocumentsBatchBuilder::FieldValues DocumentsBatchReader::toFieldValues(ByteSpan record) const {
    DocumentsBatchBuilder::FieldValues out;
    ObkvReader reader(record);
    for (const auto& [id, value] : reader.fields()) {
        auto name = index_.name(id);
        if (!name) {
            throw CorruptIndexException("Field id " + std::to_string(id) +
                                        " missing from documents batch index");
        }
        out.emplace_back(*name, util::toString(value));
    }
    return out;
}

}  // namespace documents
}  // namespace sieve
