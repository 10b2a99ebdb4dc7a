// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/kv/Environment.h"

#include "sieve/util/Exceptions.h"

#include <rocksdb/comparator.h>
#include <rocksdb/db.h>
#include <rocksdb/env.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/write_batch_with_index.h>

#include <iostream>
#include <stdexcept>

namespace sieve {
namespace kv {

namespace {

/** Path of the in-memory store inside its private Env. */
constexpr const char* MEMORY_PATH = "/sieve";

rocksdb::Slice toSlice(ByteSpan bytes) {
    return rocksdb::Slice(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

ByteSpan toSpan(const rocksdb::Slice& slice) {
    return ByteSpan(reinterpret_cast<const uint8_t*>(slice.data()), slice.size());
}

rocksdb::ReadOptions readOptionsAt(const std::shared_ptr<const rocksdb::Snapshot>& snapshot) {
    rocksdb::ReadOptions options;
    options.snapshot = snapshot.get();
    return options;
}

void throwOnError(const rocksdb::Status& status, const std::string& what) {
    if (status.ok()) {
        return;
    }
    if (status.IsCorruption()) {
        throw CorruptIndexException(what + ": " + status.ToString());
    }
    throw IOException(what + ": " + status.ToString());
}

Bytes catalogKey(const std::string& name) {
    return util::toBytes(std::string(Environment::CATALOG_PREFIX) + name);
}

}  // namespace

// ==================== RangeCursor ====================

RangeCursor::RangeCursor(std::shared_ptr<const rocksdb::Snapshot> snapshot,
                         std::unique_ptr<rocksdb::Iterator> it, Bound lower, Bound upper,
                         bool reverse)
    : snapshot_(std::move(snapshot))
    , it_(std::move(it))
    , lower_(std::move(lower))
    , upper_(std::move(upper))
    , reverse_(reverse) {}

RangeCursor::~RangeCursor() = default;

RangeCursor::RangeCursor(RangeCursor&& other) noexcept = default;

RangeCursor& RangeCursor::operator=(RangeCursor&& other) noexcept = default;

ByteSpan RangeCursor::key() const {
    return toSpan(it_->key());
}

ByteSpan RangeCursor::value() const {
    return toSpan(it_->value());
}

bool RangeCursor::next() {
    if (done_) {
        return false;
    }

    if (!started_) {
        started_ = true;
        seek();
    } else if (reverse_) {
        it_->Prev();
    } else {
        it_->Next();
    }

    if (!it_->Valid()) {
        throwOnError(it_->status(), "Range iteration failed");
        done_ = true;
        return false;
    }
    if (!inRange()) {
        done_ = true;
        return false;
    }
    return true;
}

void RangeCursor::seek() {
    if (reverse_) {
        if (upper_.isUnbounded()) {
            it_->SeekToLast();
            return;
        }
        it_->SeekForPrev(toSlice(upper_.key));
        if (upper_.kind == Bound::Kind::Excluded && it_->Valid() &&
            util::bytesEqual(key(), upper_.key)) {
            it_->Prev();
        }
        return;
    }

    if (lower_.isUnbounded()) {
        it_->SeekToFirst();
        return;
    }
    it_->Seek(toSlice(lower_.key));
    if (lower_.kind == Bound::Kind::Excluded && it_->Valid() &&
        util::bytesEqual(key(), lower_.key)) {
        it_->Next();
    }
}

bool RangeCursor::inRange() const {
    // The seek already honours the starting bound; only the far end is checked.
    const Bound& limit = reverse_ ? lower_ : upper_;
    if (limit.isUnbounded()) {
        return true;
    }
    int cmp = util::compareBytes(key(), limit.key);
    if (reverse_) {
        cmp = -cmp;
    }
    return limit.kind == Bound::Kind::Included ? cmp <= 0 : cmp < 0;
}

// ==================== ReadTxn ====================

std::optional<Bytes> ReadTxn::getRaw(rocksdb::ColumnFamilyHandle* cf, ByteSpan key) const {
    std::string value;
    rocksdb::Status status = env_->db()->Get(readOptionsAt(snapshot_), cf, toSlice(key), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    throwOnError(status, "Get failed");
    return util::toBytes(value);
}

std::unique_ptr<rocksdb::Iterator> ReadTxn::newIterator(rocksdb::ColumnFamilyHandle* cf) const {
    return std::unique_ptr<rocksdb::Iterator>(env_->db()->NewIterator(readOptionsAt(snapshot_), cf));
}

std::optional<Database> ReadTxn::openDatabase(const std::string& name) const {
    ensureActive();
    if (!getRaw(env_->catalog(), catalogKey(name))) {
        return std::nullopt;
    }
    rocksdb::ColumnFamilyHandle* handle = env_->handleFor(name, false);
    if (handle == nullptr) {
        throw CorruptIndexException("Database " + name + " is cataloged but has no column family");
    }
    return Database(name, handle);
}

std::optional<Bytes> ReadTxn::get(const Database& db, ByteSpan key) const {
    ensureActive();
    return getRaw(db.handle_, key);
}

RangeCursor ReadTxn::range(const Database& db, const Bound& lower, const Bound& upper) const {
    ensureActive();
    return makeCursor(db.handle_, lower, upper, false);
}

RangeCursor ReadTxn::revRange(const Database& db, const Bound& lower, const Bound& upper) const {
    ensureActive();
    return makeCursor(db.handle_, lower, upper, true);
}

RangeCursor ReadTxn::makeCursor(rocksdb::ColumnFamilyHandle* cf, const Bound& lower,
                                const Bound& upper, bool reverse) const {
    RangeCursor cursor(snapshot_, newIterator(cf), lower, upper, reverse);

    if (!lower.isUnbounded() && !upper.isUnbounded()) {
        int cmp = util::compareBytes(lower.key, upper.key);
        bool empty = cmp > 0 || (cmp == 0 && (lower.kind == Bound::Kind::Excluded ||
                                              upper.kind == Bound::Kind::Excluded));
        if (empty) {
            cursor.done_ = true;
        }
    }
    return cursor;
}

size_t ReadTxn::len(const Database& db) const {
    size_t count = 0;
    auto cursor = range(db, Bound::unbounded(), Bound::unbounded());
    while (cursor.next()) {
        count++;
    }
    return count;
}

bool ReadTxn::isEmpty(const Database& db) const {
    auto cursor = range(db, Bound::unbounded(), Bound::unbounded());
    return !cursor.next();
}

std::vector<std::string> ReadTxn::databaseNames() const {
    ensureActive();
    const std::string prefix = Environment::CATALOG_PREFIX;
    std::vector<std::string> names;
    auto cursor = makeCursor(env_->catalog(), Bound::included(util::asSpan(prefix)),
                             Bound::unbounded(), false);
    while (cursor.next()) {
        std::string key = util::toString(cursor.key());
        if (key.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        names.push_back(key.substr(prefix.size()));
    }
    return names;
}

// ==================== WriteTxn ====================

WriteTxn::WriteTxn(const Environment* env, std::unique_lock<std::mutex> lock,
                   std::shared_ptr<const rocksdb::Snapshot> snapshot)
    : ReadTxn(env, std::move(snapshot))
    , writerLock_(std::move(lock))
    // overwrite_key lets the batch iterator show only the latest write per key
    , batch_(std::make_unique<rocksdb::WriteBatchWithIndex>(rocksdb::BytewiseComparator(), 0,
                                                            true)) {}

WriteTxn::WriteTxn(WriteTxn&& other) noexcept
    : ReadTxn(std::move(other))
    , writerLock_(std::move(other.writerLock_))
    , batch_(std::move(other.batch_))
    , active_(other.active_) {
    other.active_ = false;
}

WriteTxn::~WriteTxn() {
    abort();
}

void WriteTxn::ensureActive() const {
    if (!active_) {
        throw AlreadyClosedException("Write transaction is no longer active");
    }
}

std::optional<Bytes> WriteTxn::getRaw(rocksdb::ColumnFamilyHandle* cf, ByteSpan key) const {
    std::string value;
    rocksdb::Status status = batch_->GetFromBatchAndDB(env_->db(), readOptionsAt(snapshot_), cf,
                                                       toSlice(key), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    throwOnError(status, "Get failed");
    return util::toBytes(value);
}

std::unique_ptr<rocksdb::Iterator> WriteTxn::newIterator(rocksdb::ColumnFamilyHandle* cf) const {
    std::unique_ptr<rocksdb::Iterator> base(env_->db()->NewIterator(readOptionsAt(snapshot_), cf));
    // The batch iterator takes ownership of the base iterator.
    return std::unique_ptr<rocksdb::Iterator>(batch_->NewIteratorWithBase(cf, base.release()));
}

Database WriteTxn::createDatabase(const std::string& name) {
    ensureActive();
    if (name.empty() || name == rocksdb::kDefaultColumnFamilyName) {
        throw std::invalid_argument("Invalid database name: '" + name + "'");
    }
    rocksdb::ColumnFamilyHandle* handle = env_->handleFor(name, true);
    const Bytes key = catalogKey(name);
    if (!getRaw(env_->catalog(), key)) {
        throwOnError(batch_->Put(env_->catalog(), toSlice(key), rocksdb::Slice()),
                     "Cataloging database " + name + " failed");
    }
    return Database(name, handle);
}

void WriteTxn::put(const Database& db, ByteSpan key, ByteSpan value) {
    ensureActive();
    throwOnError(batch_->Put(db.handle_, toSlice(key), toSlice(value)), "Put failed");
}

bool WriteTxn::del(const Database& db, ByteSpan key) {
    ensureActive();
    if (!getRaw(db.handle_, key)) {
        return false;
    }
    throwOnError(batch_->Delete(db.handle_, toSlice(key)), "Delete failed");
    return true;
}

void WriteTxn::clear(const Database& db) {
    deleteRange(db, Bound::unbounded(), Bound::unbounded());
}

size_t WriteTxn::deleteRange(const Database& db, const Bound& lower, const Bound& upper) {
    ensureActive();
    std::vector<Bytes> doomed;
    {
        auto cursor = range(db, lower, upper);
        while (cursor.next()) {
            doomed.push_back(util::toBytes(cursor.key()));
        }
    }
    for (const auto& key : doomed) {
        throwOnError(batch_->Delete(db.handle_, toSlice(key)), "Delete failed");
    }
    return doomed.size();
}

void WriteTxn::commit() {
    ensureActive();

    rocksdb::WriteOptions options;
    options.sync = env_->isPersistent();
    rocksdb::Status status = env_->db()->Write(options, batch_->GetWriteBatch());
    if (!status.ok()) {
        abort();
        throwOnError(status, "Commit failed");
    }

    batch_.reset();
    snapshot_.reset();
    active_ = false;
    writerLock_.unlock();
}

void WriteTxn::abort() noexcept {
    if (!active_) {
        return;
    }
    batch_.reset();
    snapshot_.reset();
    active_ = false;
    if (writerLock_.owns_lock()) {
        writerLock_.unlock();
    }
}

// ==================== Environment ====================

Environment::Environment()
    : Environment(MEMORY_PATH,
                  std::unique_ptr<rocksdb::Env>(rocksdb::NewMemEnv(rocksdb::Env::Default()))) {}

Environment::Environment(std::string path, std::unique_ptr<rocksdb::Env> memEnv)
    : memEnv_(std::move(memEnv))
    , path_(std::move(path)) {
    rocksdb::DBOptions options;
    options.create_if_missing = true;
    options.create_missing_column_families = true;
    if (memEnv_) {
        options.env = memEnv_.get();
    }

    std::vector<std::string> names;
    rocksdb::Status listed = rocksdb::DB::ListColumnFamilies(options, path_, &names);
    if (listed.IsCorruption()) {
        throwOnError(listed, "Cannot list databases in " + path_);
    }
    if (!listed.ok() || names.empty()) {
        // Fresh store
        names = {rocksdb::kDefaultColumnFamilyName};
    }

    std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
    descriptors.reserve(names.size());
    for (const auto& name : names) {
        descriptors.emplace_back(name, rocksdb::ColumnFamilyOptions());
    }

    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    rocksdb::DB* raw = nullptr;
    throwOnError(rocksdb::DB::Open(options, path_, descriptors, &handles, &raw),
                 "Cannot open store " + path_);
    db_.reset(raw);

    for (size_t i = 0; i < names.size(); i++) {
        handles_.emplace(names[i], handles[i]);
    }
}

Environment::~Environment() {
    if (!db_) {
        return;
    }
    for (auto& entry : handles_) {
        rocksdb::Status status = db_->DestroyColumnFamilyHandle(entry.second);
        if (!status.ok()) {
            std::cerr << "[Environment] Releasing database " << entry.first
                      << " failed: " << status.ToString() << std::endl;
        }
    }
    handles_.clear();
    rocksdb::Status status = db_->Close();
    if (!status.ok()) {
        std::cerr << "[Environment] Closing " << path_ << " failed: " << status.ToString()
                  << std::endl;
    }
    db_.reset();
}

std::unique_ptr<Environment> Environment::open(const std::filesystem::path& path) {
    if (path.empty()) {
        throw std::invalid_argument("Environment::open requires a path");
    }
    return std::unique_ptr<Environment>(new Environment(path.string(), nullptr));
}

ReadTxn Environment::readTxn() const {
    return ReadTxn(this, takeSnapshot());
}

WriteTxn Environment::writeTxn() {
    std::unique_lock<std::mutex> lock(writerMutex_);
    return WriteTxn(this, std::move(lock), takeSnapshot());
}

rocksdb::ColumnFamilyHandle* Environment::catalog() const noexcept {
    return db_->DefaultColumnFamily();
}

rocksdb::ColumnFamilyHandle* Environment::handleFor(const std::string& name, bool create) const {
    std::lock_guard<std::mutex> guard(handlesMutex_);
    auto it = handles_.find(name);
    if (it != handles_.end()) {
        return it->second;
    }
    if (!create) {
        return nullptr;
    }
    rocksdb::ColumnFamilyHandle* handle = nullptr;
    throwOnError(db_->CreateColumnFamily(rocksdb::ColumnFamilyOptions(), name, &handle),
                 "Cannot create database " + name);
    handles_.emplace(name, handle);
    return handle;
}

std::shared_ptr<const rocksdb::Snapshot> Environment::takeSnapshot() const {
    rocksdb::DB* db = db_.get();
    return std::shared_ptr<const rocksdb::Snapshot>(
        db->GetSnapshot(), [db](const rocksdb::Snapshot* snapshot) { db->ReleaseSnapshot(snapshot); });
}

}  // namespace kv
}  // namespace sieve
