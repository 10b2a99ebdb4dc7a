// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/StoreWriter.h"

#include "sieve/observability/Metrics.h"
#include "sieve/util/Exceptions.h"

namespace sieve {
namespace extsort {

StoreWriteStats writeIntoDatabase(kv::WriteTxn& wtxn, const kv::Database& db, MergeSource& source,
                                  const MergeFunction& mergeFn) {
    auto& registry = observability::MetricsRegistry::instance();
    auto puts = registry.getCounter(observability::metric_names::STORE_WRITER_PUTS);
    auto merges = registry.getCounter(observability::metric_names::STORE_WRITER_MERGES);
    auto timer = registry.getTimer(observability::metric_names::STORE_WRITER_WRITE);
    observability::ScopedTimer scoped(*timer);

    StoreWriteStats stats;
    while (source.next()) {
        ByteSpan key = source.key();
        stats.entries++;

        auto existing = wtxn.get(db, key);
        if (!existing) {
            wtxn.put(db, key, source.value());
            puts->inc();
            continue;
        }

        Bytes merged;
        try {
            merged = mergeFn.merge(key, {ByteSpan(*existing), source.value()});
        } catch (const MergeConflictException& e) {
            throw MergeConflictException(
                "Error while merging keys in database " + db.name() +
                " (process: get-put-merge): " + e.what());
        }
        wtxn.put(db, key, merged);
        stats.merged++;
        puts->inc();
        merges->inc();
    }
    return stats;
}

StoreWriteStats writeIntoDatabase(kv::WriteTxn& wtxn, const kv::Database& db,
                                  const ChunkReader& reader, const MergeFunction& mergeFn) {
    auto cursor = reader.cursor();
    return writeIntoDatabase(wtxn, db, cursor, mergeFn);
}

StoreWriteStats sorterIntoDatabase(kv::WriteTxn& wtxn, const kv::Database& db, Sorter&& sorter,
                                   const MergeFunction& mergeFn) {
    auto stream = sorter.intoStream();
    return writeIntoDatabase(wtxn, db, stream, mergeFn);
}

}  // namespace extsort
}  // namespace sieve
