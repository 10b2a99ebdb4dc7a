// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/extsort/ChunkCreator.h"

#include "sieve/store/ByteBuffersIndexInput.h"
#include "sieve/store/ByteBuffersIndexOutput.h"
#include "sieve/util/Exceptions.h"

#include <iostream>

namespace sieve {
namespace extsort {

namespace {

class TempFileChunkStorage : public ChunkStorage {
public:
    TempFileChunkStorage(store::Directory& directory, std::string name)
        : directory_(directory)
        , name_(std::move(name)) {}

    ~TempFileChunkStorage() override {
        try {
            if (!directory_.isClosed() && directory_.fileExists(name_)) {
                directory_.deleteFile(name_);
            }
        } catch (const IOException& e) {
            std::cerr << "[ChunkCreator] Failed to delete temporary chunk " << name_ << ": "
                      << e.what() << std::endl;
        }
    }

    std::unique_ptr<store::IndexInput> openInput() const override {
        return directory_.openInput(name_);
    }

    std::string getName() const override { return name_; }

private:
    store::Directory& directory_;
    std::string name_;
};

class InMemoryChunkStorage : public ChunkStorage {
public:
    InMemoryChunkStorage(std::string name, std::shared_ptr<std::vector<uint8_t>> buffer)
        : name_(std::move(name))
        , buffer_(std::move(buffer)) {}

    std::unique_ptr<store::IndexInput> openInput() const override {
        return std::make_unique<store::ByteBuffersIndexInput>(name_, buffer_);
    }

    std::string getName() const override { return name_; }

private:
    std::string name_;
    std::shared_ptr<std::vector<uint8_t>> buffer_;
};

}  // namespace

PendingChunk TempFileChunkCreator::create() {
    auto output = directory_.createTempOutput(prefix_, ".chunk");
    auto storage = std::make_shared<TempFileChunkStorage>(directory_, output->getName());
    return PendingChunk{std::move(output), std::move(storage)};
}

PendingChunk InMemoryChunkCreator::create() {
    std::string name = "memory-chunk-" + std::to_string(counter_.fetch_add(1));
    auto buffer = std::make_shared<std::vector<uint8_t>>();
    auto output = std::make_unique<store::ByteBuffersIndexOutput>(name, buffer);
    auto storage = std::make_shared<InMemoryChunkStorage>(name, std::move(buffer));
    return PendingChunk{std::move(output), std::move(storage)};
}

}  // namespace extsort
}  // namespace sieve
