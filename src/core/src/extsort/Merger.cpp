// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/Merger.h"

#include <stdexcept>

namespace sieve {
namespace extsort {

// ==================== MergerBuilder ====================

MergerBuilder::MergerBuilder(MergeFunctionPtr mergeFn)
    : mergeFn_(std::move(mergeFn)) {
    if (!mergeFn_) {
        throw std::invalid_argument("MergerBuilder requires a merge function");
    }
}

MergerBuilder& MergerBuilder::push(std::unique_ptr<MergeSource> source) {
    if (source) {
        sources_.push_back(std::move(source));
    }
    return *this;
}

MergerIterator MergerBuilder::build() {
    return MergerIterator(std::move(mergeFn_), std::move(sources_));
}

// ==================== MergerIterator ====================

MergerIterator::MergerIterator(MergeFunctionPtr mergeFn,
                               std::vector<std::unique_ptr<MergeSource>> sources)
    : mergeFn_(std::move(mergeFn))
    , sources_(std::move(sources))
    , mergedKeys_(observability::MetricsRegistry::instance().getCounter(
          observability::metric_names::MERGER_MERGED_KEYS)) {}

bool MergerIterator::HeapGreater::operator()(const HeapEntry& a, const HeapEntry& b) const {
    int cmp = util::compareBytes(a.source->key(), b.source->key());
    if (cmp != 0) {
        return cmp > 0;
    }
    return a.index > b.index;
}

bool MergerIterator::next() {
    if (!initialized_) {
        initialized_ = true;
        for (size_t i = 0; i < sources_.size(); i++) {
            if (sources_[i]->next()) {
                heap_.push(HeapEntry{sources_[i].get(), i});
            }
        }
    }

    if (heap_.empty()) {
        currentKey_.clear();
        currentValue_.clear();
        return false;
    }

    // Pop every source positioned on the smallest key; ties come out in push order.
    const ByteSpan smallest = heap_.top().source->key();
    currentKey_.assign(smallest.begin(), smallest.end());
    pendingValues_.clear();

    std::vector<HeapEntry> advanced;
    while (!heap_.empty() && util::bytesEqual(heap_.top().source->key(), currentKey_)) {
        HeapEntry entry = heap_.top();
        heap_.pop();
        const ByteSpan value = entry.source->value();
        pendingValues_.emplace_back(value.begin(), value.end());
        advanced.push_back(entry);
    }

    // Sources leave the queue before they move, so queued keys never change.
    for (const auto& entry : advanced) {
        if (entry.source->next()) {
            heap_.push(entry);
        }
    }

    if (pendingValues_.size() == 1) {
        currentValue_ = std::move(pendingValues_[0]);
    } else {
        std::vector<ByteSpan> values(pendingValues_.begin(), pendingValues_.end());
        currentValue_ = mergeFn_->merge(ByteSpan(currentKey_), values);
        mergedKeys_->inc();
    }
    return true;
}

}  // namespace extsort
}  // namespace sieve
