// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/store/IndexOutput.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sieve {
namespace store {

/**
 * IndexOutput implementation that writes to a shared in-memory buffer.
 *
 * The buffer is held through a shared_ptr so an in-memory chunk can be
 * reopened for reading (see ByteBuffersIndexInput) without copying.
 *
 * Based on: org.apache.lucene.store.ByteBuffersDataOutput
 */
class ByteBuffersIndexOutput : public IndexOutput {
public:
    explicit ByteBuffersIndexOutput(const std::string& name)
        : name_(name)
        , buffer_(std::make_shared<std::vector<uint8_t>>()) {
        buffer_->reserve(1024);
    }

    /**
     * Writes into an existing buffer, appending after its current contents.
     */
    ByteBuffersIndexOutput(const std::string& name, std::shared_ptr<std::vector<uint8_t>> buffer)
        : name_(name)
        , buffer_(std::move(buffer)) {}

    // ==================== Basic Writing ====================

    void writeByte(uint8_t b) override { buffer_->push_back(b); }

    void writeBytes(const uint8_t* buf, size_t length) override {
        buffer_->insert(buffer_->end(), buf, buf + length);
    }

    // ==================== Positioning ====================

    int64_t getFilePointer() const override { return static_cast<int64_t>(buffer_->size()); }

    std::string getName() const override { return name_; }

    // ==================== Finalization ====================

    void close() override {}

    // ==================== Buffer Access ====================

    const std::vector<uint8_t>& toArrayCopy() const { return *buffer_; }

    /**
     * Shared handle on the written bytes.
     */
    std::shared_ptr<const std::vector<uint8_t>> buffer() const { return buffer_; }

    size_t size() const { return buffer_->size(); }

    void reset() { buffer_->clear(); }

private:
    std::string name_;
    std::shared_ptr<std::vector<uint8_t>> buffer_;
};

}  // namespace store
}  // namespace sieve
