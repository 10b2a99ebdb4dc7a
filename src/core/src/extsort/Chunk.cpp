// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/Chunk.h"

#include "sieve/compression/CompressionCodecs.h"
#include "sieve/util/Exceptions.h"
#include "sieve/util/VByte.h"

#include <cstring>

namespace sieve {
namespace extsort {

using util::VByte;

std::string toString(ChunkCompression compression) {
    switch (compression) {
        case ChunkCompression::None:
            return "none";
        case ChunkCompression::Fast:
            return "fast";
        case ChunkCompression::High:
            return "high";
    }
    return "unknown";
}

compression::CompressionCodecPtr codecFor(ChunkCompression compression, int level) {
    switch (compression) {
        case ChunkCompression::None:
            return compression::NoneCodec::create();
        case ChunkCompression::Fast:
            return compression::LZ4Codec::create();
        case ChunkCompression::High:
            return compression::ZSTDCodec::create(
                level == 0 ? compression::ZSTDCodec::DEFAULT_LEVEL : level);
    }
    throw std::invalid_argument("Unknown chunk compression: " +
                                std::to_string(static_cast<int>(compression)));
}

// ==================== ChunkWriter ====================

ChunkWriter::ChunkWriter(std::unique_ptr<store::IndexOutput> output, ChunkCompression compression,
                         int level)
    : ownedOutput_(std::move(output))
    , output_(ownedOutput_.get())
    , compression_(compression)
    , codec_(codecFor(compression, level)) {
    if (!output_) {
        throw std::invalid_argument("ChunkWriter requires an output");
    }
    writeHeader();
}

ChunkWriter::ChunkWriter(store::IndexOutput& output, ChunkCompression compression, int level)
    : output_(&output)
    , compression_(compression)
    , codec_(codecFor(compression, level)) {
    writeHeader();
}

ChunkWriter::ChunkWriter(ChunkCreator& creator, ChunkCompression compression, int level)
    : compression_(compression)
    , codec_(codecFor(compression, level)) {
    auto pending = creator.create();
    ownedOutput_ = std::move(pending.output);
    output_ = ownedOutput_.get();
    storage_ = std::move(pending.storage);
    writeHeader();
}

void ChunkWriter::writeHeader() {
    output_->writeBytes(chunk_format::MAGIC, sizeof(chunk_format::MAGIC));
    output_->writeByte(chunk_format::VERSION);
    output_->writeByte(static_cast<uint8_t>(compression_));
    block_.reserve(chunk_format::BLOCK_SIZE + 256);
}

void ChunkWriter::insert(ByteSpan key, ByteSpan value) {
    if (finished_) {
        throw AlreadyClosedException("ChunkWriter already finished");
    }
    if (entryCount_ > 0 && util::compareBytes(key, lastKey_) <= 0) {
        throw std::invalid_argument("ChunkWriter: keys must be inserted in strictly increasing "
                                    "order");
    }

    VByte::appendUInt32(block_, static_cast<uint32_t>(key.size()));
    VByte::appendUInt32(block_, static_cast<uint32_t>(value.size()));
    block_.insert(block_.end(), key.begin(), key.end());
    block_.insert(block_.end(), value.begin(), value.end());

    lastKey_.assign(key.begin(), key.end());
    entryCount_++;

    if (block_.size() >= chunk_format::BLOCK_SIZE) {
        flushBlock();
    }
}

void ChunkWriter::flushBlock() {
    if (block_.empty()) {
        return;
    }

    compressed_.resize(codec_->getMaxCompressedSize(block_.size()));
    size_t storedLen =
        codec_->compress(reinterpret_cast<const char*>(block_.data()), block_.size(),
                         reinterpret_cast<char*>(compressed_.data()), compressed_.size());

    output_->writeVInt(static_cast<int32_t>(block_.size()));
    output_->writeVInt(static_cast<int32_t>(storedLen));
    output_->writeBytes(compressed_.data(), storedLen);
    block_.clear();
}

uint64_t ChunkWriter::finish() {
    if (finished_) {
        return entryCount_;
    }
    flushBlock();
    output_->writeVInt(0);
    output_->writeLong(static_cast<int64_t>(entryCount_));
    if (ownedOutput_) {
        ownedOutput_->close();
    }
    finished_ = true;
    return entryCount_;
}

std::unique_ptr<ChunkReader> ChunkWriter::intoReader() {
    if (!storage_) {
        throw IOException("ChunkWriter on " + output_->getName() +
                          " has no storage to reopen; open the file with a ChunkReader");
    }
    finish();
    return std::make_unique<ChunkReader>(storage_);
}

// ==================== ChunkCursor ====================

ChunkCursor::ChunkCursor(std::unique_ptr<store::IndexInput> input,
                         compression::CompressionCodecPtr codec, uint64_t expectedEntries,
                         std::shared_ptr<ChunkStorage> storage)
    : input_(std::move(input))
    , codec_(std::move(codec))
    , storage_(std::move(storage))
    , expectedEntries_(expectedEntries) {}

bool ChunkCursor::readBlock() {
    int32_t rawLen = input_->readVInt();
    if (rawLen == 0) {
        return false;
    }
    int32_t storedLen = input_->readVInt();
    if (rawLen < 0 || storedLen < 0) {
        throw CorruptIndexException("Negative block length in chunk " + input_->toString());
    }

    stored_.resize(static_cast<size_t>(storedLen));
    input_->readBytes(stored_.data(), stored_.size());

    block_.resize(static_cast<size_t>(rawLen));
    size_t decoded;
    try {
        decoded = codec_->decompress(reinterpret_cast<const char*>(stored_.data()), stored_.size(),
                                     reinterpret_cast<char*>(block_.data()), block_.size());
    } catch (const std::runtime_error& e) {
        throw CorruptIndexException("Cannot decompress block of chunk " + input_->toString() +
                                    ": " + e.what());
    }
    if (decoded != block_.size()) {
        throw CorruptIndexException("Block size mismatch in chunk " + input_->toString());
    }
    blockPos_ = 0;
    return true;
}

bool ChunkCursor::moveOnNext() {
    if (exhausted_) {
        return false;
    }

    try {
        if (blockPos_ >= block_.size() && !readBlock()) {
            exhausted_ = true;
            if (entriesRead_ != expectedEntries_) {
                throw CorruptIndexException("Chunk " + input_->toString() + " holds " +
                                            std::to_string(entriesRead_) + " entries, footer says " +
                                            std::to_string(expectedEntries_));
            }
            return false;
        }
    } catch (const EOFException& e) {
        exhausted_ = true;
        throw CorruptIndexException("Truncated chunk " + input_->toString() + ": " + e.what());
    }

    ByteSpan block(block_);
    uint32_t keyLen = VByte::readUInt32(block, blockPos_);
    uint32_t valueLen = VByte::readUInt32(block, blockPos_);
    if (static_cast<uint64_t>(keyLen) + valueLen > block.size() - blockPos_) {
        exhausted_ = true;
        throw CorruptIndexException("Entry overruns block in chunk " + input_->toString());
    }
    key_ = block.subspan(blockPos_, keyLen);
    blockPos_ += keyLen;
    value_ = block.subspan(blockPos_, valueLen);
    blockPos_ += valueLen;
    entriesRead_++;
    return true;
}

// ==================== ChunkReader ====================

ChunkReader::ChunkReader(std::unique_ptr<store::IndexInput> input)
    : input_(std::move(input)) {
    if (!input_) {
        throw std::invalid_argument("ChunkReader requires an input");
    }
    readHeaderAndFooter();
}

ChunkReader::ChunkReader(std::shared_ptr<ChunkStorage> storage)
    : storage_(std::move(storage)) {
    if (!storage_) {
        throw std::invalid_argument("ChunkReader requires a storage");
    }
    input_ = storage_->openInput();
    readHeaderAndFooter();
}

void ChunkReader::readHeaderAndFooter() {
    const int64_t length = input_->length();
    if (length < static_cast<int64_t>(chunk_format::HEADER_SIZE + 1 + chunk_format::FOOTER_SIZE)) {
        throw CorruptIndexException("Chunk too short: " + input_->toString());
    }

    input_->seek(0);
    uint8_t magic[sizeof(chunk_format::MAGIC)];
    input_->readBytes(magic, sizeof(magic));
    if (std::memcmp(magic, chunk_format::MAGIC, sizeof(magic)) != 0) {
        throw CorruptIndexException("Not a chunk (bad magic): " + input_->toString());
    }
    uint8_t version = input_->readByte();
    if (version != chunk_format::VERSION) {
        throw CorruptIndexException("Unsupported chunk version " + std::to_string(version) +
                                    ": " + input_->toString());
    }
    uint8_t codecId = input_->readByte();
    if (codecId > static_cast<uint8_t>(ChunkCompression::High)) {
        throw CorruptIndexException("Unknown chunk codec " + std::to_string(codecId) + ": " +
                                    input_->toString());
    }
    compression_ = static_cast<ChunkCompression>(codecId);
    codec_ = codecFor(compression_);

    input_->seek(length - static_cast<int64_t>(chunk_format::FOOTER_SIZE));
    int64_t count = input_->readLong();
    if (count < 0) {
        throw CorruptIndexException("Negative entry count in chunk " + input_->toString());
    }
    entryCount_ = static_cast<uint64_t>(count);
    input_->seek(static_cast<int64_t>(chunk_format::HEADER_SIZE));
}

ChunkCursor ChunkReader::cursor() const {
    auto input = input_->clone();
    input->seek(static_cast<int64_t>(chunk_format::HEADER_SIZE));
    return ChunkCursor(std::move(input), codec_, entryCount_, storage_);
}

std::unique_ptr<MergeSource> ChunkReader::source() const {
    auto input = input_->clone();
    input->seek(static_cast<int64_t>(chunk_format::HEADER_SIZE));
    return std::unique_ptr<MergeSource>(
        new ChunkCursor(std::move(input), codec_, entryCount_, storage_));
}

}  // namespace extsort
}  // namespace sieve
