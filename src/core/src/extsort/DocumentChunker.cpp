// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/DocumentChunker.h"

#include <stdexcept>

namespace sieve {
namespace extsort {

DocumentChunker::DocumentChunker(const ChunkReader& source, ChunkParameters params,
                                 size_t documentsChunkSize, ChunkCreator& creator)
    : cursor_(source.cursor())
    , params_(std::move(params))
    , documentsChunkSize_(documentsChunkSize)
    , creator_(creator) {
    if (documentsChunkSize_ == 0) {
        throw std::invalid_argument("DocumentChunker: documentsChunkSize must be positive");
    }
}

std::unique_ptr<ChunkReader> DocumentChunker::next() {
    if (!pendingEntry_ && !sourceDone_) {
        pendingEntry_ = cursor_.moveOnNext();
        sourceDone_ = !pendingEntry_;
    }

    if (sourceDone_ && !pendingEntry_) {
        if (emittedAny_) {
            return nullptr;
        }
        emittedAny_ = true;
        return createWriter(params_, creator_)->intoReader();
    }

    auto writer = createWriter(params_, creator_);
    size_t accumulated = 0;
    while (pendingEntry_) {
        writer->insert(cursor_.key(), cursor_.value());
        accumulated += cursor_.key().size() + cursor_.value().size();

        pendingEntry_ = cursor_.moveOnNext();
        sourceDone_ = !pendingEntry_;
        if (accumulated >= documentsChunkSize_) {
            break;
        }
    }

    emittedAny_ = true;
    return writer->intoReader();
}

}  // namespace extsort
}  // namespace sieve
