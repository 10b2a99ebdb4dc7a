// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/Chunk.h"
#include "sieve/extsort/MergeFunction.h"
#include "sieve/extsort/MergeSource.h"
#include "sieve/extsort/Sorter.h"
#include "sieve/kv/Environment.h"

#include <cstdint>

namespace sieve {
namespace extsort {

/**
 * @brief What a store write did.
 */
struct StoreWriteStats {
    /** Keys read from the input */
    uint64_t entries = 0;
    /** Keys that already existed and were merged with the stored value */
    uint64_t merged = 0;
};

/**
 * @brief Writes a sorted stream into a database, merging with stored values.
 *
 * For every key: if the database holds the exact key, put
 * merge(key, [stored, incoming]); otherwise put the incoming value. A
 * refusal of the merge function is rethrown as MergeConflictException
 * naming the get-put-merge step.
 *
 * The caller owns the transaction. Nothing is committed here: after an
 * exception the transaction should be dropped, which aborts it and leaves
 * the store unchanged.
 */
StoreWriteStats writeIntoDatabase(kv::WriteTxn& wtxn, const kv::Database& db, MergeSource& source,
                                  const MergeFunction& mergeFn);

/**
 * @brief writeIntoDatabase over every entry of a chunk.
 */
StoreWriteStats writeIntoDatabase(kv::WriteTxn& wtxn, const kv::Database& db,
                                  const ChunkReader& reader, const MergeFunction& mergeFn);

/**
 * @brief Consumes a sorter and writes its merged stream into a database.
 */
StoreWriteStats sorterIntoDatabase(kv::WriteTxn& wtxn, const kv::Database& db, Sorter&& sorter,
                                   const MergeFunction& mergeFn);

}  // namespace extsort
}  // namespace sieve
