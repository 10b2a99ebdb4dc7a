// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/MergeFunction.h"
#include "sieve/util/Bytes.h"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace sieve {
namespace documents {

using util::Bytes;
using util::ByteSpan;

using FieldId = uint16_t;

/**
 * Document record layout: a run of fields sorted by id, each
 *
 *   u16 BE field id | u32 BE value length | value bytes
 */
namespace obkv_format {
inline constexpr size_t FIELD_HEADER_SIZE = 6;
}  // namespace obkv_format

/**
 * @brief Builds one document record.
 *
 * Fields must be inserted in strictly increasing id order.
 */
class ObkvWriter {
public:
    ObkvWriter() = default;

    /**
     * @throws std::invalid_argument if id is not greater than the previous id
     */
    void insert(FieldId id, ByteSpan value);

    [[nodiscard]] size_t fieldCount() const noexcept { return fieldCount_; }

    [[nodiscard]] const Bytes& bytes() const noexcept { return buffer_; }

    /**
     * @brief Releases the record and resets the writer.
     */
    Bytes take();

private:
    Bytes buffer_;
    size_t fieldCount_ = 0;
    int32_t lastId_ = -1;
};

/**
 * @brief Read-only view over a record. Validated on construction; the
 * viewed bytes must outlive the reader.
 */
class ObkvReader {
public:
    using Field = std::pair<FieldId, ByteSpan>;

    /**
     * @throws CorruptIndexException on a truncated record or unsorted ids
     */
    explicit ObkvReader(ByteSpan record);

    [[nodiscard]] std::optional<ByteSpan> get(FieldId id) const;

    [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }

    [[nodiscard]] size_t size() const noexcept { return fields_.size(); }

    [[nodiscard]] bool isEmpty() const noexcept { return fields_.empty(); }

private:
    std::vector<Field> fields_;
};

/**
 * Values are document records; the result holds every field seen, a field
 * present in several records takes its value from the last one.
 */
class ObkvFieldMerge : public extsort::MergeFunction {
public:
    Bytes merge(ByteSpan key, const std::vector<ByteSpan>& values) const override;

    std::string getName() const override { return "obkv-field"; }

    static extsort::MergeFunctionPtr create();
};

}  // namespace documents
}  // namespace sieve
