// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/store/IndexInput.h"
#include "sieve/util/Exceptions.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sieve {
namespace store {

/**
 * IndexInput implementation that reads from an in-memory byte buffer.
 *
 * Clones share the buffer; only the position is per instance.
 *
 * Based on: org.apache.lucene.store.ByteBuffersDataInput
 */
class ByteBuffersIndexInput : public IndexInput {
public:
    ByteBuffersIndexInput(const std::string& name, std::shared_ptr<const std::vector<uint8_t>> buffer)
        : name_(name)
        , buffer_(std::move(buffer))
        , position_(0) {}

    ByteBuffersIndexInput(const std::string& name, const std::vector<uint8_t>& buffer)
        : ByteBuffersIndexInput(name, std::make_shared<const std::vector<uint8_t>>(buffer)) {}

    // ==================== Basic Reading ====================

    uint8_t readByte() override {
        if (position_ >= buffer_->size()) {
            throw EOFException("Attempt to read past end of input: " + name_);
        }
        return (*buffer_)[position_++];
    }

    void readBytes(uint8_t* buf, size_t length) override {
        if (position_ + length > buffer_->size()) {
            throw EOFException("Attempt to read past end of input: " + name_);
        }
        std::copy(buffer_->begin() + position_, buffer_->begin() + position_ + length, buf);
        position_ += length;
    }

    // ==================== Positioning ====================

    int64_t getFilePointer() const override { return static_cast<int64_t>(position_); }

    void seek(int64_t pos) override {
        if (pos < 0 || pos > static_cast<int64_t>(buffer_->size())) {
            throw IOException("Invalid seek position: " + std::to_string(pos));
        }
        position_ = static_cast<size_t>(pos);
    }

    int64_t length() const override { return static_cast<int64_t>(buffer_->size()); }

    std::string toString() const override { return name_; }

    // ==================== Cloning ====================

    std::unique_ptr<IndexInput> clone() const override {
        auto cloned = std::make_unique<ByteBuffersIndexInput>(name_, buffer_);
        cloned->position_ = position_;
        return cloned;
    }

private:
    std::string name_;
    std::shared_ptr<const std::vector<uint8_t>> buffer_;
    size_t position_;
};

}  // namespace store
}  // namespace sieve
