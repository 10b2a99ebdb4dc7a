// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/Sorter.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace sieve {
namespace extsort {

namespace {

/**
 * The unspilled buffer of a sorter as a merge source: sorted entries with
 * runs of equal keys coalesced on the fly.
 */
class SortedBufferSource : public MergeSource {
public:
    struct Entry {
        size_t offset;
        uint32_t keyLen;
        uint32_t valueLen;
    };

    SortedBufferSource(MergeFunctionPtr mergeFn, Bytes arena, std::vector<Entry> entries)
        : mergeFn_(std::move(mergeFn))
        , arena_(std::move(arena))
        , entries_(std::move(entries)) {}

    bool next() override {
        if (pos_ >= entries_.size()) {
            return false;
        }

        size_t runEnd = pos_ + 1;
        while (runEnd < entries_.size() &&
               util::bytesEqual(keyOf(entries_[runEnd]), keyOf(entries_[pos_]))) {
            runEnd++;
        }

        key_ = keyOf(entries_[pos_]);
        if (runEnd - pos_ == 1) {
            value_ = valueOf(entries_[pos_]);
        } else {
            std::vector<ByteSpan> values;
            values.reserve(runEnd - pos_);
            for (size_t i = pos_; i < runEnd; i++) {
                values.push_back(valueOf(entries_[i]));
            }
            merged_ = mergeFn_->merge(key_, values);
            value_ = ByteSpan(merged_);
        }
        pos_ = runEnd;
        return true;
    }

    ByteSpan key() const override { return key_; }

    ByteSpan value() const override { return value_; }

private:
    ByteSpan keyOf(const Entry& e) const { return ByteSpan(arena_.data() + e.offset, e.keyLen); }

    ByteSpan valueOf(const Entry& e) const {
        return ByteSpan(arena_.data() + e.offset + e.keyLen, e.valueLen);
    }

    MergeFunctionPtr mergeFn_;
    Bytes arena_;
    std::vector<Entry> entries_;
    size_t pos_ = 0;
    ByteSpan key_;
    ByteSpan value_;
    Bytes merged_;
};

}  // namespace

Sorter::Sorter(MergeFunctionPtr mergeFn, SorterOptions options)
    : mergeFn_(std::move(mergeFn))
    , options_(std::move(options)) {
    if (!mergeFn_) {
        throw std::invalid_argument("Sorter requires a merge function");
    }
    if (options_.dumpThreshold == 0) {
        throw std::invalid_argument("Sorter: dumpThreshold must be positive");
    }
    if (options_.maxNbChunks && *options_.maxNbChunks == 0) {
        throw std::invalid_argument("Sorter: maxNbChunks must be positive");
    }
    if (!options_.chunkCreator) {
        options_.chunkCreator = std::make_shared<InMemoryChunkCreator>();
    }
    if (!options_.allowRealloc) {
        arena_.reserve(options_.dumpThreshold);
    }

    auto& registry = observability::MetricsRegistry::instance();
    spillsCounter_ = registry.getCounter(observability::metric_names::SORTER_SPILLS);
    entriesCounter_ = registry.getCounter(observability::metric_names::SORTER_ENTRIES);
    compactionsCounter_ = registry.getCounter(observability::metric_names::SORTER_COMPACTIONS);
    bufferedBytes_ = registry.getGauge(observability::metric_names::SORTER_BUFFERED_BYTES);
}

size_t Sorter::memoryUsage() const noexcept {
    return arena_.size() + entries_.size() * ENTRY_OVERHEAD;
}

void Sorter::insert(ByteSpan key, ByteSpan value) {
    const size_t payload = key.size() + value.size();
    const size_t needed = payload + ENTRY_OVERHEAD;

    if (!entries_.empty()) {
        bool overBudget = memoryUsage() + needed > options_.dumpThreshold;
        bool wouldRealloc = !options_.allowRealloc && arena_.size() + payload > arena_.capacity();
        if (overBudget || wouldRealloc) {
            spill();
        }
    }

    EntryRef ref{arena_.size(), static_cast<uint32_t>(key.size()),
                 static_cast<uint32_t>(value.size())};
    arena_.insert(arena_.end(), key.begin(), key.end());
    arena_.insert(arena_.end(), value.begin(), value.end());
    entries_.push_back(ref);

    entryCount_++;
    entriesCounter_->inc();
    bufferedBytes_->add(static_cast<int64_t>(needed));
}

void Sorter::sortBuffer() {
    std::stable_sort(entries_.begin(), entries_.end(), [this](const EntryRef& a, const EntryRef& b) {
        return util::compareBytes(keyOf(a), keyOf(b)) < 0;
    });
}

void Sorter::spill() {
    sortBuffer();

    ChunkWriter writer(*options_.chunkCreator, options_.compression, options_.compressionLevel);
    std::vector<ByteSpan> values;
    size_t i = 0;
    while (i < entries_.size()) {
        size_t runEnd = i + 1;
        while (runEnd < entries_.size() &&
               util::bytesEqual(keyOf(entries_[runEnd]), keyOf(entries_[i]))) {
            runEnd++;
        }

        if (runEnd - i == 1) {
            writer.insert(keyOf(entries_[i]), valueOf(entries_[i]));
        } else {
            values.clear();
            for (size_t j = i; j < runEnd; j++) {
                values.push_back(valueOf(entries_[j]));
            }
            Bytes merged = mergeFn_->merge(keyOf(entries_[i]), values);
            writer.insert(keyOf(entries_[i]), merged);
        }
        i = runEnd;
    }

    chunks_.push_back(writer.intoReader());
    spillCount_++;
    spillsCounter_->inc();

    if (options_.verbose) {
        std::cerr << "[Sorter] Spilled chunk #" << spillCount_ << " (" << entries_.size()
                  << " entries, " << memoryUsage() << " bytes buffered, "
                  << chunks_.back()->entryCount() << " unique keys)" << std::endl;
    }

    bufferedBytes_->add(-static_cast<int64_t>(memoryUsage()));
    arena_.clear();
    entries_.clear();

    if (options_.maxNbChunks && chunks_.size() >= *options_.maxNbChunks && chunks_.size() > 1) {
        compact();
    }
}

void Sorter::compact() {
    MergerBuilder builder(mergeFn_);
    for (const auto& chunk : chunks_) {
        builder.push(chunk->source());
    }
    auto merger = builder.build();

    ChunkWriter writer(*options_.chunkCreator, options_.compression, options_.compressionLevel);
    while (merger.next()) {
        writer.insert(merger.key(), merger.value());
    }

    size_t merged = chunks_.size();
    std::vector<std::unique_ptr<ChunkReader>> compacted;
    compacted.push_back(writer.intoReader());
    chunks_ = std::move(compacted);
    compactionsCounter_->inc();

    if (options_.verbose) {
        std::cerr << "[Sorter] Compacted " << merged << " chunks into one ("
                  << chunks_.front()->entryCount() << " keys)" << std::endl;
    }
}

MergerIterator Sorter::intoStream() {
    MergerBuilder builder(mergeFn_);
    for (const auto& chunk : chunks_) {
        builder.push(chunk->source());
    }
    chunks_.clear();

    if (!entries_.empty()) {
        sortBuffer();
        std::vector<SortedBufferSource::Entry> entries;
        entries.reserve(entries_.size());
        for (const auto& e : entries_) {
            entries.push_back({e.offset, e.keyLen, e.valueLen});
        }
        bufferedBytes_->add(-static_cast<int64_t>(memoryUsage()));
        builder.push(
            std::make_unique<SortedBufferSource>(mergeFn_, std::move(arena_), std::move(entries)));
        arena_ = Bytes();
        entries_.clear();
    }

    return builder.build();
}

void Sorter::writeIntoChunkWriter(ChunkWriter& writer) {
    auto stream = intoStream();
    while (stream.next()) {
        writer.insert(stream.key(), stream.value());
    }
}

}  // namespace extsort
}  // namespace sieve
