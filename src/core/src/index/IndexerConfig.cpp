// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/index/IndexerConfig.h"

#include "sieve/compression/CompressionCodecs.h"

#include <stdexcept>
#include <string>

namespace sieve {
namespace index {

IndexerConfig& IndexerConfig::setMaxMemory(std::optional<size_t> bytes) {
    if (bytes && *bytes == 0) {
        throw std::invalid_argument("maxMemory must be positive");
    }
    maxMemory_ = bytes;
    return *this;
}

IndexerConfig& IndexerConfig::setMaxNbChunks(std::optional<size_t> chunks) {
    if (chunks && *chunks == 0) {
        throw std::invalid_argument("maxNbChunks must be positive");
    }
    maxNbChunks_ = chunks;
    return *this;
}

IndexerConfig& IndexerConfig::setChunkCompressionLevel(int level) {
    if (level != 0 && (level < compression::ZSTDCodec::MIN_LEVEL ||
                       level > compression::ZSTDCodec::MAX_LEVEL)) {
        throw std::invalid_argument("Chunk compression level must be 0 or in [" +
                                    std::to_string(compression::ZSTDCodec::MIN_LEVEL) + ", " +
                                    std::to_string(compression::ZSTDCodec::MAX_LEVEL) + "]");
    }
    chunkCompressionLevel_ = level;
    return *this;
}

IndexerConfig& IndexerConfig::setDocumentsChunkSize(size_t bytes) {
    if (bytes == 0) {
        throw std::invalid_argument("documentsChunkSize must be positive");
    }
    documentsChunkSize_ = bytes;
    return *this;
}

IndexerConfig& IndexerConfig::setThreadCount(size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("threadCount must be positive");
    }
    threadCount_ = threads;
    return *this;
}

IndexerConfig& IndexerConfig::setFacetGroupSize(uint8_t groupSize) {
    if (groupSize < 2 || groupSize > facet::FacetLevelsBuilder::MAX_GROUP_SIZE) {
        throw std::invalid_argument("Facet group size must be in [2, " +
                                    std::to_string(facet::FacetLevelsBuilder::MAX_GROUP_SIZE) +
                                    "]");
    }
    facetGroupSize_ = groupSize;
    return *this;
}

IndexerConfig& IndexerConfig::setFacetMinLevelSize(uint8_t minLevelSize) {
    if (minLevelSize == 0) {
        throw std::invalid_argument("Facet min level size must be positive");
    }
    facetMinLevelSize_ = minLevelSize;
    return *this;
}

extsort::ChunkParameters IndexerConfig::chunkParameters() const {
    extsort::ChunkParameters params;
    params.compression = chunkCompression_;
    params.compressionLevel = chunkCompressionLevel_;
    params.maxMemory = maxMemory_;
    params.maxNbChunks = maxNbChunks_;
    return params;
}

extsort::SorterOptions IndexerConfig::sorterOptions(
    std::shared_ptr<extsort::ChunkCreator> creator) const {
    extsort::SorterOptions options;
    if (maxMemory_) {
        options.dumpThreshold = *maxMemory_;
        options.allowRealloc = false;
    }
    options.maxNbChunks = maxNbChunks_;
    options.compression = chunkCompression_;
    options.compressionLevel = chunkCompressionLevel_;
    options.chunkCreator = std::move(creator);
    options.verbose = verbose_;
    return options;
}

extsort::Sorter IndexerConfig::createSorter(extsort::MergeFunctionPtr mergeFn,
                                            std::shared_ptr<extsort::ChunkCreator> creator) const {
    return extsort::Sorter(std::move(mergeFn), sorterOptions(std::move(creator)));
}

facet::FacetLevelsBuilder IndexerConfig::levelsBuilder() const {
    return facet::FacetLevelsBuilder(facetGroupSize_, facetMinLevelSize_);
}

}  // namespace index
}  // namespace sieve
