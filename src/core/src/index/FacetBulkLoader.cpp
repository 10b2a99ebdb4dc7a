// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/index/FacetBulkLoader.h"

#include "sieve/documents/DocumentsBatch.h"
#include "sieve/extsort/DocumentChunker.h"
#include "sieve/extsort/ParallelSorter.h"
#include "sieve/extsort/StoreWriter.h"
#include "sieve/facet/FacetBoundCodecs.h"
#include "sieve/util/NumericUtils.h"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace sieve {
namespace index {

namespace {

/**
 * Parses a stored JSON value as a number. Only plain JSON number text is
 * accepted (no quotes, no surrounding whitespace).
 */
std::optional<double> parseJsonNumber(util::ByteSpan value) {
    if (value.empty()) {
        return std::nullopt;
    }
    const char first = static_cast<char>(value[0]);
    if (first != '-' && (first < '0' || first > '9')) {
        return std::nullopt;
    }
    const std::string text = util::toString(value);
    char* end = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(number)) {
        return std::nullopt;
    }
    return number;
}

}  // namespace

FacetBulkLoader::FacetBulkLoader(IndexerConfig config,
                                 std::shared_ptr<extsort::ChunkCreator> creator)
    : config_(std::move(config))
    , creator_(creator ? std::move(creator) : std::make_shared<extsort::InMemoryChunkCreator>())
    , mergeFn_(facet::FacetGroupValueMerge::create())
    , sorter_(config_.createSorter(mergeFn_, creator_)) {}

void FacetBulkLoader::insert(facet::FieldId fieldId, util::ByteSpan bound,
                             util::DocumentId docid) {
    util::DocIdBitmap docids;
    docids.insert(docid);
    insert(fieldId, bound, docids);
}

void FacetBulkLoader::insert(facet::FieldId fieldId, util::ByteSpan bound,
                             const util::DocIdBitmap& docids) {
    if (docids.isEmpty()) {
        return;
    }
    const auto key = facet::FacetGroupKey::encode(fieldId, 0, bound);
    const auto value = facet::FacetGroupValue{1, docids}.encode();
    sorter_.insert(key, value);
    touchedFields_.insert(fieldId);
}

FacetBulkLoadStats FacetBulkLoader::load(kv::WriteTxn& wtxn, const kv::Database& db) {
    extsort::Sorter sorter = std::exchange(sorter_, config_.createSorter(mergeFn_, creator_));
    if (config_.isVerbose()) {
        std::cerr << "[FacetBulkLoader] Loading " << sorter.entryCount() << " values ("
                  << sorter.spillCount() << " spills) into " << db.name() << std::endl;
    }

    auto writeStats = extsort::sorterIntoDatabase(wtxn, db, std::move(sorter), *mergeFn_);

    FacetBulkLoadStats stats;
    stats.entries = writeStats.entries;
    stats.merged = writeStats.merged;
    for (auto fieldId : touchedFields_) {
        stats.highestLevels[fieldId] = 0;
    }
    touchedFields_.clear();
    return rebuildLevels(wtxn, db, std::move(stats));
}

FacetBulkLoadStats FacetBulkLoader::loadNumericFacets(
    kv::WriteTxn& wtxn, const kv::Database& db, const extsort::ChunkReader& batch,
    const std::map<documents::FieldId, facet::FieldId>& fields, util::DocumentId firstDocid) {
    const auto params = config_.chunkParameters();

    std::vector<std::unique_ptr<extsort::ChunkReader>> partitions;
    extsort::DocumentChunker chunker(batch, params, config_.getDocumentsChunkSize(), *creator_);
    while (auto partition = chunker.next()) {
        partitions.push_back(std::move(partition));
    }

    const auto extractor = [&fields, firstDocid](const extsort::ChunkReader& partition,
                                                 extsort::Sorter& sorter) {
        auto cursor = partition.cursor();
        while (cursor.moveOnNext()) {
            if (cursor.key().size() != documents::batch_format::DOCUMENT_KEY_SIZE) {
                continue;  // field index entry
            }
            const auto docid = static_cast<util::DocumentId>(
                firstDocid + util::NumericUtils::bytesToIntBE(cursor.key().data()));
            util::DocIdBitmap docids;
            docids.insert(docid);
            const auto value = facet::FacetGroupValue{1, docids}.encode();

            documents::ObkvReader record(cursor.value());
            for (const auto& [batchField, facetField] : fields) {
                auto stored = record.get(batchField);
                if (!stored) {
                    continue;
                }
                auto number = parseJsonNumber(*stored);
                if (!number) {
                    continue;
                }
                sorter.insert(facet::FacetGroupKey::encode(
                                  facetField, 0, facet::OrderedF64Codec::encode(*number)),
                              value);
            }
        }
    };

    if (config_.isVerbose()) {
        std::cerr << "[FacetBulkLoader] Extracting " << fields.size() << " numeric fields from "
                  << batch.entryCount() << " batch entries in " << partitions.size()
                  << " partitions on " << config_.getThreadCount() << " threads" << std::endl;
    }

    auto sorted = extsort::sortInParallel(partitions, extractor, mergeFn_, params,
                                          config_.getThreadCount(), creator_);
    auto writeStats = extsort::writeIntoDatabase(wtxn, db, *sorted, *mergeFn_);

    FacetBulkLoadStats stats;
    stats.entries = writeStats.entries;
    stats.merged = writeStats.merged;
    for (const auto& entry : fields) {
        stats.highestLevels[entry.second] = 0;
    }
    return rebuildLevels(wtxn, db, std::move(stats));
}

FacetBulkLoadStats FacetBulkLoader::rebuildLevels(kv::WriteTxn& wtxn, const kv::Database& db,
                                                  FacetBulkLoadStats stats) const {
    const auto builder = config_.levelsBuilder();
    for (auto& [fieldId, highest] : stats.highestLevels) {
        highest = builder.rebuild(wtxn, db, fieldId);
        if (config_.isVerbose()) {
            std::cerr << "[FacetBulkLoader] Field " << fieldId << " rebuilt up to level "
                      << static_cast<int>(highest) << std::endl;
        }
    }
    return stats;
}

}  // namespace index
}  // namespace sieve
