// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/ChunkParameters.h"

#include "sieve/extsort/Merger.h"

namespace sieve {
namespace extsort {

std::unique_ptr<ChunkWriter> createWriter(const ChunkParameters& params, ChunkCreator& creator) {
    return std::make_unique<ChunkWriter>(creator, params.compression, params.compressionLevel);
}

Sorter createSorter(MergeFunctionPtr mergeFn, const ChunkParameters& params,
                    std::shared_ptr<ChunkCreator> creator, std::optional<size_t> maxMemory) {
    SorterOptions options;
    options.compression = params.compression;
    options.compressionLevel = params.compressionLevel;
    options.maxNbChunks = params.maxNbChunks;
    options.chunkCreator = std::move(creator);
    if (maxMemory) {
        options.dumpThreshold = std::max<size_t>(*maxMemory, 1);
        options.allowRealloc = false;
    }
    return Sorter(std::move(mergeFn), options);
}

std::unique_ptr<ChunkReader> mergeReaders(std::vector<std::unique_ptr<ChunkReader>> readers,
                                          MergeFunctionPtr mergeFn, const ChunkParameters& params,
                                          ChunkCreator& creator) {
    MergerBuilder builder(std::move(mergeFn));
    for (const auto& reader : readers) {
        builder.push(reader->source());
    }
    auto merger = builder.build();

    auto writer = createWriter(params, creator);
    while (merger.next()) {
        writer->insert(merger.key(), merger.value());
    }
    return writer->intoReader();
}

std::unique_ptr<ChunkReader> sorterIntoReader(Sorter&& sorter, const ChunkParameters& params,
                                              ChunkCreator& creator) {
    auto writer = createWriter(params, creator);
    sorter.writeIntoChunkWriter(*writer);
    return writer->intoReader();
}

}  // namespace extsort
}  // namespace sieve
