// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/util/Bytes.h"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rocksdb {
class ColumnFamilyHandle;
class DB;
class Env;
class Iterator;
class Snapshot;
class WriteBatchWithIndex;
}  // namespace rocksdb

namespace sieve {
namespace kv {

using util::Bytes;
using util::ByteSpan;

class Environment;
class ReadTxn;
class WriteTxn;

/**
 * @brief Handle on a named database, valid in every transaction of the
 * environment that created it.
 *
 * Each database is one RocksDB column family.
 */
class Database {
public:
    const std::string& name() const noexcept { return name_; }

    bool operator==(const Database& other) const noexcept { return name_ == other.name_; }

private:
    friend class ReadTxn;
    friend class WriteTxn;

    Database(std::string name, rocksdb::ColumnFamilyHandle* handle)
        : name_(std::move(name))
        , handle_(handle) {}

    std::string name_;
    rocksdb::ColumnFamilyHandle* handle_;
};

/**
 * @brief One end of a key range.
 */
struct Bound {
    enum class Kind : uint8_t { Included, Excluded, Unbounded };

    Kind kind = Kind::Unbounded;
    Bytes key;

    static Bound included(ByteSpan key) { return Bound{Kind::Included, util::toBytes(key)}; }

    static Bound excluded(ByteSpan key) { return Bound{Kind::Excluded, util::toBytes(key)}; }

    static Bound unbounded() { return Bound{}; }

    bool isUnbounded() const noexcept { return kind == Kind::Unbounded; }
};

/**
 * @brief Cursor over a key range, forward or reverse.
 *
 * A cursor from a read transaction pins its snapshot and stays valid after
 * the transaction object is gone. A cursor from a write transaction sees the
 * uncommitted batch and must not outlive commit() or abort(); writing to the
 * database being iterated invalidates it.
 *
 * Usage:
 * ```cpp
 * auto cursor = rtxn.range(db, Bound::included(start), Bound::unbounded());
 * while (cursor.next()) {
 *     use(cursor.key(), cursor.value());
 * }
 * ```
 */
class RangeCursor {
public:
    ~RangeCursor();

    RangeCursor(RangeCursor&& other) noexcept;
    RangeCursor& operator=(RangeCursor&& other) noexcept;
    RangeCursor(const RangeCursor&) = delete;
    RangeCursor& operator=(const RangeCursor&) = delete;

    /**
     * @brief Advances to the next entry.
     * @return false once the range is exhausted
     * @throws IOException if the underlying iterator fails
     */
    bool next();

    /** Current key; valid after next() returned true. */
    ByteSpan key() const;

    /** Current value; valid after next() returned true. */
    ByteSpan value() const;

    bool isReverse() const noexcept { return reverse_; }

private:
    friend class ReadTxn;

    RangeCursor(std::shared_ptr<const rocksdb::Snapshot> snapshot,
                std::unique_ptr<rocksdb::Iterator> it, Bound lower, Bound upper, bool reverse);

    void seek();

    bool inRange() const;

    // Declared before the iterator so the snapshot is released after it.
    std::shared_ptr<const rocksdb::Snapshot> snapshot_;
    std::unique_ptr<rocksdb::Iterator> it_;
    Bound lower_;
    Bound upper_;
    bool reverse_;
    bool started_ = false;
    bool done_ = false;
};

/**
 * @brief Read-only snapshot of the environment.
 *
 * Sees exactly the state of the last commit before it was opened. Never
 * blocks writers and is never blocked by them.
 */
class ReadTxn {
public:
    virtual ~ReadTxn() = default;

    ReadTxn(ReadTxn&&) = default;
    ReadTxn& operator=(ReadTxn&&) = default;
    ReadTxn(const ReadTxn&) = delete;
    ReadTxn& operator=(const ReadTxn&) = delete;

    /**
     * @return handle if a database of that name exists in this snapshot
     */
    [[nodiscard]] std::optional<Database> openDatabase(const std::string& name) const;

    /**
     * @return the value stored under the exact key, if any
     */
    [[nodiscard]] std::optional<Bytes> get(const Database& db, ByteSpan key) const;

    /**
     * @brief Ascending cursor over [lower, upper] with the given bound kinds.
     */
    [[nodiscard]] RangeCursor range(const Database& db, const Bound& lower,
                                    const Bound& upper) const;

    /**
     * @brief Descending cursor over [lower, upper] with the given bound kinds.
     */
    [[nodiscard]] RangeCursor revRange(const Database& db, const Bound& lower,
                                       const Bound& upper) const;

    [[nodiscard]] size_t len(const Database& db) const;

    [[nodiscard]] bool isEmpty(const Database& db) const;

    /** All database names, sorted. */
    [[nodiscard]] std::vector<std::string> databaseNames() const;

protected:
    friend class Environment;

    ReadTxn(const Environment* env, std::shared_ptr<const rocksdb::Snapshot> snapshot)
        : env_(env)
        , snapshot_(std::move(snapshot)) {}

    /** Point lookup in the column family as this transaction sees it. */
    virtual std::optional<Bytes> getRaw(rocksdb::ColumnFamilyHandle* cf, ByteSpan key) const;

    virtual std::unique_ptr<rocksdb::Iterator> newIterator(rocksdb::ColumnFamilyHandle* cf) const;

    virtual void ensureActive() const {}

    const Environment* env_;
    std::shared_ptr<const rocksdb::Snapshot> snapshot_;

private:
    RangeCursor makeCursor(rocksdb::ColumnFamilyHandle* cf, const Bound& lower,
                           const Bound& upper, bool reverse) const;
};

/**
 * @brief The single write transaction of an environment.
 *
 * Opening one blocks while another is alive. Changes accumulate in an
 * indexed write batch that this transaction reads through, and become
 * visible to new readers on commit(). Destroying an uncommitted transaction
 * aborts it; an aborted transaction leaves the environment exactly as it was.
 */
class WriteTxn : public ReadTxn {
public:
    ~WriteTxn() override;

    WriteTxn(WriteTxn&& other) noexcept;
    WriteTxn& operator=(WriteTxn&&) = delete;

    /**
     * @brief Opens the named database, creating it empty if missing. The
     * database becomes visible to other transactions on commit().
     * @throws std::invalid_argument for an empty or reserved name
     */
    Database createDatabase(const std::string& name);

    /**
     * @brief Inserts or overwrites the value of key.
     */
    void put(const Database& db, ByteSpan key, ByteSpan value);

    /**
     * @return true if the key existed
     */
    bool del(const Database& db, ByteSpan key);

    /**
     * @brief Removes every entry of the database.
     */
    void clear(const Database& db);

    /**
     * @return number of entries removed
     */
    size_t deleteRange(const Database& db, const Bound& lower, const Bound& upper);

    /**
     * @brief Applies the batch atomically. Persistent environments sync the
     * write-ahead log before returning.
     * @throws IOException if the write fails; the transaction is then aborted
     */
    void commit();

    /**
     * @brief Discards the changes. Idempotent.
     */
    void abort() noexcept;

    [[nodiscard]] bool isActive() const noexcept { return active_; }

protected:
    std::optional<Bytes> getRaw(rocksdb::ColumnFamilyHandle* cf, ByteSpan key) const override;

    std::unique_ptr<rocksdb::Iterator> newIterator(rocksdb::ColumnFamilyHandle* cf) const override;

    void ensureActive() const override;

private:
    friend class Environment;

    WriteTxn(const Environment* env, std::unique_lock<std::mutex> lock,
             std::shared_ptr<const rocksdb::Snapshot> snapshot);

    std::unique_lock<std::mutex> writerLock_;
    std::unique_ptr<rocksdb::WriteBatchWithIndex> batch_;
    bool active_ = true;
};

/**
 * @brief Transactional ordered key-value environment on RocksDB.
 *
 * Snapshot isolation with one writer at a time. Named databases are column
 * families; their names are recorded in a catalog in the default column
 * family so that creating one commits or aborts with its transaction.
 *
 * The environment must outlive every transaction and cursor it hands out.
 *
 * Usage:
 * ```cpp
 * auto env = kv::Environment::open(path);
 * auto wtxn = env->writeTxn();
 * auto db = wtxn.createDatabase("facet-f64");
 * wtxn.put(db, key, value);
 * wtxn.commit();
 * ```
 */
class Environment {
public:
    /** Catalog key prefix in the default column family. */
    static constexpr const char* CATALOG_PREFIX = "sieve.database.";

    /**
     * @brief In-memory environment.
     */
    Environment();

    /**
     * @brief Opens or creates a persistent environment in the directory.
     * @throws CorruptIndexException if the store cannot be recovered
     * @throws IOException if the store cannot be opened, e.g. while another
     * environment holds it
     */
    static std::unique_ptr<Environment> open(const std::filesystem::path& path);

    ~Environment();

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    [[nodiscard]] ReadTxn readTxn() const;

    /**
     * @brief Begins the write transaction, waiting for the current one to finish.
     */
    [[nodiscard]] WriteTxn writeTxn();

    [[nodiscard]] bool isPersistent() const noexcept { return !memEnv_; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    friend class ReadTxn;
    friend class WriteTxn;

    Environment(std::string path, std::unique_ptr<rocksdb::Env> memEnv);

    rocksdb::DB* db() const noexcept { return db_.get(); }

    rocksdb::ColumnFamilyHandle* catalog() const noexcept;

    /**
     * @return the column family of the database, created on demand
     */
    rocksdb::ColumnFamilyHandle* handleFor(const std::string& name, bool create) const;

    std::shared_ptr<const rocksdb::Snapshot> takeSnapshot() const;

    // The in-memory Env must outlive the DB.
    std::unique_ptr<rocksdb::Env> memEnv_;
    std::string path_;
    std::unique_ptr<rocksdb::DB> db_;

    mutable std::mutex handlesMutex_;
    mutable std::map<std::string, rocksdb::ColumnFamilyHandle*> handles_;

    std::mutex writerMutex_;
};

}  // namespace kv
}  // namespace sieve
