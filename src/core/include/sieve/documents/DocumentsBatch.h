// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/documents/Obkv.h"
#include "sieve/extsort/Chunk.h"
#include "sieve/store/IndexInput.h"
#include "sieve/store/IndexOutput.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sieve {
namespace documents {

/**
 * Canonical documents batch: a chunk whose keys are the big-endian u32
 * positions of the documents (0, 1, 2, ...) and whose values are document
 * records. The last entry has key FF FF FF FF FF FF FF FF and holds the
 * serialized DocumentsBatchIndex.
 */
namespace batch_format {
inline constexpr uint8_t INDEX_KEY[8] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
inline constexpr size_t DOCUMENT_KEY_SIZE = 4;
}  // namespace batch_format

/**
 * @brief Bidirectional field name <-> field id map of a batch.
 *
 * Ids are handed out in first-seen order starting at 0.
 *
 * Serialized as VInt count, then per field: u16 BE id | VInt len | name.
 */
class DocumentsBatchIndex {
public:
    /**
     * @brief Id of name, assigning the next free id on first sight.
     * @throws std::invalid_argument once all 65536 ids are taken
     */
    FieldId insert(const std::string& name);

    [[nodiscard]] std::optional<FieldId> id(const std::string& name) const;

    [[nodiscard]] std::optional<std::string> name(FieldId id) const;

    [[nodiscard]] size_t size() const noexcept { return names_.size(); }

    [[nodiscard]] bool isEmpty() const noexcept { return names_.empty(); }

    /**
     * @brief Field names in id order.
     */
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

    [[nodiscard]] Bytes serialize() const;

    /**
     * @throws CorruptIndexException on malformed bytes or non-dense ids
     */
    static DocumentsBatchIndex deserialize(ByteSpan bytes);

private:
    std::vector<std::string> names_;
    std::map<std::string, FieldId, std::less<>> ids_;
};

/**
 * @brief Writes documents into a canonical batch.
 *
 * Usage:
 * ```cpp
 * ByteBuffersIndexOutput output("batch");
 * DocumentsBatchBuilder builder(output);
 * builder.appendDocument({{"id", "1"}, {"title", "\"Dune\""}});
 * builder.finish();
 * ```
 */
class DocumentsBatchBuilder {
public:
    using FieldValues = std::vector<std::pair<std::string, std::string>>;

    /**
     * @brief The builder writes into output but does not close it.
     */
    explicit DocumentsBatchBuilder(store::IndexOutput& output,
                                   extsort::ChunkCompression compression =
                                       extsort::ChunkCompression::None);

    /**
     * @brief Registers a field ahead of the documents (CSV headers), so ids
     * follow the declaration order.
     */
    FieldId declareField(const std::string& name) { return index_.insert(name); }

    /**
     * @brief Appends a document given as (field name, value) pairs. A name
     * repeated within one document keeps its last value.
     * @throws std::invalid_argument after 2^32 - 1 documents
     */
    void appendDocument(const FieldValues& fields);

    /**
     * @brief Appends a record already encoded with the ids of index().
     */
    void appendRecord(ByteSpan record);

    [[nodiscard]] uint64_t documentsCount() const noexcept { return documentsCount_; }

    [[nodiscard]] const DocumentsBatchIndex& index() const noexcept { return index_; }

    /**
     * @brief Writes the field index and the chunk footer.
     * @return number of documents
     */
    uint64_t finish();

private:
    extsort::ChunkWriter writer_;
    DocumentsBatchIndex index_;
    uint64_t documentsCount_ = 0;
};

/**
 * @brief Forward cursor over the documents of a batch.
 */
class DocumentsBatchCursor {
public:
    /**
     * @return false after the last document
     */
    bool next();

    [[nodiscard]] uint32_t documentPosition() const noexcept { return position_; }

    [[nodiscard]] ByteSpan record() const { return cursor_.value(); }

    [[nodiscard]] ObkvReader reader() const { return ObkvReader(cursor_.value()); }

private:
    friend class DocumentsBatchReader;

    DocumentsBatchCursor(extsort::ChunkCursor cursor, uint64_t documentsCount)
        : cursor_(std::move(cursor))
        , documentsCount_(documentsCount) {}

    extsort::ChunkCursor cursor_;
    uint64_t documentsCount_;
    uint64_t read_ = 0;
    uint32_t position_ = 0;
};

/**
 * @brief Opens a canonical batch and decodes its field index.
 */
class DocumentsBatchReader {
public:
    /**
     * @throws CorruptIndexException if the batch has no field index entry
     */
    explicit DocumentsBatchReader(std::unique_ptr<extsort::ChunkReader> chunk);

    explicit DocumentsBatchReader(std::unique_ptr<store::IndexInput> input);

    [[nodiscard]] uint64_t documentsCount() const noexcept { return documentsCount_; }

    [[nodiscard]] bool isEmpty() const noexcept { return documentsCount_ == 0; }

    [[nodiscard]] const DocumentsBatchIndex& index() const noexcept { return index_; }

    [[nodiscard]] DocumentsBatchCursor cursor() const;

    /**
     * @brief Named (field, value) pairs of a record, in field id order.
     */
    [[nodiscard]] DocumentsBatchBuilder::FieldValues toFieldValues(ByteSpan record) const;

private:
    std::unique_ptr<extsort::ChunkReader> chunk_;
    DocumentsBatchIndex index_;
    uint64_t documentsCount_ = 0;
};

}  // namespace documents
}  // namespace sieve
