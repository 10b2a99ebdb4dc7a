// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/compression/ICompressionCodec.h"
#include "sieve/extsort/ChunkCreator.h"
#include "sieve/extsort/MergeSource.h"
#include "sieve/store/IndexInput.h"
#include "sieve/store/IndexOutput.h"
#include "sieve/util/Bytes.h"

#include <cstdint>
#include <memory>
#include <string>

namespace sieve {
namespace extsort {

using util::Bytes;
using util::ByteSpan;

/**
 * Block compression of a chunk.
 */
enum class ChunkCompression : uint8_t {
    None = 0,
    Fast = 1,  // LZ4
    High = 2   // ZSTD
};

std::string toString(ChunkCompression compression);

/**
 * @brief Codec implementing a chunk compression.
 * @param level ZSTD level for High, 0 selects the codec default
 */
compression::CompressionCodecPtr codecFor(ChunkCompression compression, int level = 0);

/**
 * Chunk stream layout (all integers big-endian, VInt as in IndexOutput):
 *
 *   "SCHK" | version byte | codec byte
 *   block*: VInt rawLen | VInt storedLen | storedLen bytes
 *   VInt 0 (end of blocks)
 *   Long entryCount
 *
 * A decompressed block is a run of entries:
 *   VInt keyLen | VInt valueLen | key | value
 */
namespace chunk_format {
inline constexpr uint8_t MAGIC[4] = {'S', 'C', 'H', 'K'};
inline constexpr uint8_t VERSION = 1;
inline constexpr size_t HEADER_SIZE = 6;
inline constexpr size_t FOOTER_SIZE = 8;
inline constexpr size_t BLOCK_SIZE = 8 * 1024;
}  // namespace chunk_format

class ChunkReader;

/**
 * @brief Writes a sorted key/value stream into a chunk.
 *
 * Keys must be inserted in strictly increasing byte order. finish() writes
 * the footer and closes the output.
 *
 * Usage:
 * ```cpp
 * ChunkWriter writer(creator, ChunkCompression::Fast);
 * writer.insert(key1, value1);
 * writer.insert(key2, value2);
 * auto reader = writer.intoReader();
 * ```
 */
class ChunkWriter {
public:
    /**
     * @brief Writes into an output owned by the caller's directory.
     * @param level ZSTD level for ChunkCompression::High, 0 for the default
     */
    ChunkWriter(std::unique_ptr<store::IndexOutput> output,
                ChunkCompression compression = ChunkCompression::None, int level = 0);

    /**
     * @brief Writes into an output the caller keeps owning. finish() writes
     * the footer but leaves closing the output to the caller.
     */
    explicit ChunkWriter(store::IndexOutput& output,
                         ChunkCompression compression = ChunkCompression::None, int level = 0);

    /**
     * @brief Writes into a fresh chunk of the creator; the result can be
     * reopened with intoReader().
     */
    explicit ChunkWriter(ChunkCreator& creator,
                         ChunkCompression compression = ChunkCompression::None, int level = 0);

    ~ChunkWriter() = default;

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    /**
     * @throws std::invalid_argument if key is not greater than the previous key
     * @throws AlreadyClosedException after finish()
     */
    void insert(ByteSpan key, ByteSpan value);

    /**
     * @brief Flushes the last block, writes the footer and closes the output.
     * @return number of entries written
     */
    uint64_t finish();

    /**
     * @brief Finishes the chunk and opens a reader over it.
     * @throws IOException if the writer was built on a bare output
     */
    std::unique_ptr<ChunkReader> intoReader();

    [[nodiscard]] uint64_t entryCount() const noexcept { return entryCount_; }

    [[nodiscard]] ChunkCompression compression() const noexcept { return compression_; }

private:
    void writeHeader();
    void flushBlock();

    std::unique_ptr<store::IndexOutput> ownedOutput_;
    store::IndexOutput* output_ = nullptr;
    std::shared_ptr<ChunkStorage> storage_;
    ChunkCompression compression_;
    compression::CompressionCodecPtr codec_;

    Bytes block_;
    Bytes compressed_;
    Bytes lastKey_;
    uint64_t entryCount_ = 0;
    bool finished_ = false;
};

/**
 * @brief Forward cursor over the entries of a chunk.
 */
class ChunkCursor : public MergeSource {
public:
    /**
     * @brief Advances to the next entry.
     * @throws CorruptIndexException on a malformed block
     */
    bool moveOnNext();

    bool next() override { return moveOnNext(); }

    ByteSpan key() const override { return key_; }

    ByteSpan value() const override { return value_; }

private:
    friend class ChunkReader;

    ChunkCursor(std::unique_ptr<store::IndexInput> input, compression::CompressionCodecPtr codec,
                uint64_t expectedEntries, std::shared_ptr<ChunkStorage> storage);

    bool readBlock();

    std::unique_ptr<store::IndexInput> input_;
    compression::CompressionCodecPtr codec_;
    std::shared_ptr<ChunkStorage> storage_;
    uint64_t expectedEntries_;
    uint64_t entriesRead_ = 0;

    Bytes block_;
    Bytes stored_;
    size_t blockPos_ = 0;
    ByteSpan key_;
    ByteSpan value_;
    bool exhausted_ = false;
};

/**
 * @brief Read access to a finished chunk.
 *
 * Validates the header and footer on construction. Any number of cursors
 * may be opened; each reads independently.
 */
class ChunkReader {
public:
    /**
     * @throws CorruptIndexException if the header or footer is invalid
     */
    explicit ChunkReader(std::unique_ptr<store::IndexInput> input);

    /**
     * @brief Opens a chunk created by a ChunkCreator, keeping its storage alive.
     */
    explicit ChunkReader(std::shared_ptr<ChunkStorage> storage);

    [[nodiscard]] uint64_t entryCount() const noexcept { return entryCount_; }

    [[nodiscard]] bool isEmpty() const noexcept { return entryCount_ == 0; }

    [[nodiscard]] ChunkCompression compression() const noexcept { return compression_; }

    /**
     * @brief Size of the chunk in bytes, header and footer included.
     */
    [[nodiscard]] int64_t byteLength() const { return input_->length(); }

    [[nodiscard]] ChunkCursor cursor() const;

    /**
     * @brief Cursor as a merge source, for MergerBuilder::push.
     */
    [[nodiscard]] std::unique_ptr<MergeSource> source() const;

private:
    void readHeaderAndFooter();

    std::shared_ptr<ChunkStorage> storage_;
    std::unique_ptr<store::IndexInput> input_;
    ChunkCompression compression_ = ChunkCompression::None;
    compression::CompressionCodecPtr codec_;
    uint64_t entryCount_ = 0;
};

}  // namespace extsort
}  // namespace sieve
