// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/documents/Obkv.h"
#include "sieve/extsort/Chunk.h"
#include "sieve/extsort/ChunkCreator.h"
#include "sieve/extsort/Sorter.h"
#include "sieve/facet/FacetGroup.h"
#include "sieve/index/IndexerConfig.h"
#include "sieve/kv/Environment.h"

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace sieve {
namespace index {

/**
 * @brief Outcome of a facet bulk load.
 */
struct FacetBulkLoadStats {
    /** Level 0 keys written (after merging duplicates of the input) */
    uint64_t entries = 0;
    /** Keys that already existed in the store */
    uint64_t merged = 0;
    /** Highest level of every rebuilt field */
    std::map<facet::FieldId, uint8_t> highestLevels;
};

/**
 * @brief Loads unsorted facet values into the level 0 of a facet database
 * and rebuilds the group levels of every touched field.
 *
 * Values go through a spilling Sorter keyed by (field, 0, bound) with
 * FacetGroupValueMerge, so memory stays within the configured budget and
 * loading the same values twice leaves the store unchanged.
 *
 * Usage:
 * ```cpp
 * FacetBulkLoader loader(IndexerConfig().setMaxMemory(64 << 20), creator);
 * loader.insert(fieldId, OrderedF64Codec::encode(price), docid);
 * auto wtxn = env.writeTxn();
 * loader.load(wtxn, db);
 * wtxn.commit();
 * ```
 */
class FacetBulkLoader {
public:
    /**
     * @param creator where spilled chunks go; in memory when null
     */
    explicit FacetBulkLoader(IndexerConfig config,
                             std::shared_ptr<extsort::ChunkCreator> creator = nullptr);

    void insert(facet::FieldId fieldId, util::ByteSpan bound, util::DocumentId docid);

    void insert(facet::FieldId fieldId, util::ByteSpan bound, const util::DocIdBitmap& docids);

    /**
     * @brief Writes the buffered values into db and rebuilds the levels of
     * the fields they belong to. The loader is empty afterwards.
     *
     * Nothing is committed; on exception drop the transaction.
     */
    FacetBulkLoadStats load(kv::WriteTxn& wtxn, const kv::Database& db);

    /**
     * @brief Extracts numeric facets from a documents batch and loads them.
     *
     * The batch is split into sub-chunks of documentsChunkSize bytes which
     * are extracted on threadCount threads. A document at position p gets
     * docid firstDocid + p. Only values that are JSON numbers are indexed
     * (bound encoded with OrderedF64Codec); other values are skipped.
     *
     * @param batch chunk written by DocumentsBatchBuilder
     * @param fields batch field id -> facet field id
     */
    FacetBulkLoadStats loadNumericFacets(kv::WriteTxn& wtxn, const kv::Database& db,
                                         const extsort::ChunkReader& batch,
                                         const std::map<documents::FieldId, facet::FieldId>& fields,
                                         util::DocumentId firstDocid = 0);

    [[nodiscard]] uint64_t pendingEntries() const noexcept { return sorter_.entryCount(); }

    [[nodiscard]] const IndexerConfig& config() const noexcept { return config_; }

private:
    FacetBulkLoadStats rebuildLevels(kv::WriteTxn& wtxn, const kv::Database& db,
                                     FacetBulkLoadStats stats) const;

    IndexerConfig config_;
    std::shared_ptr<extsort::ChunkCreator> creator_;
    extsort::MergeFunctionPtr mergeFn_;
    extsort::Sorter sorter_;
    std::set<facet::FieldId> touchedFields_;
};

}  // namespace index
}  // namespace sieve
