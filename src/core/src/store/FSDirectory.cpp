// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/store/FSDirectory.h"

#include "sieve/util/Exceptions.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <iostream>

#include <unistd.h>

namespace sieve {
namespace store {

// ==================== FSDirectory ====================

std::unique_ptr<FSDirectory> FSDirectory::open(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw IOException("Failed to create directory " + path.string() + ": " + ec.message());
    }
    return std::make_unique<FSDirectory>(path);
}

FSDirectory::FSDirectory(const std::filesystem::path& path)
    : directory_(std::filesystem::absolute(path)) {
    if (!std::filesystem::exists(directory_)) {
        throw IOException("Directory does not exist: " + directory_.string());
    }
    if (!std::filesystem::is_directory(directory_)) {
        throw IOException("Path is not a directory: " + directory_.string());
    }
}

void FSDirectory::deleteFile(const std::string& name) {
    ensureOpen();

    auto path = directory_ / name;
    bool removed = false;
    try {
        removed = std::filesystem::remove(path);
    } catch (const std::filesystem::filesystem_error& e) {
        throw IOException("Failed to delete file: " + std::string(e.what()));
    }
    if (!removed) {
        throw FileNotFoundException("File not found: " + name);
    }
}

bool FSDirectory::fileExists(const std::string& name) const {
    ensureOpen();
    std::error_code ec;
    return std::filesystem::is_regular_file(directory_ / name, ec);
}

std::unique_ptr<IndexOutput> FSDirectory::createOutput(const std::string& name) {
    ensureOpen();

    auto path = directory_ / name;
    if (std::filesystem::exists(path)) {
        throw FileAlreadyExistsException("File already exists: " + name);
    }

    return std::make_unique<FSIndexOutput>(path);
}

std::unique_ptr<IndexOutput> FSDirectory::createTempOutput(const std::string& prefix,
                                                           const std::string& suffix) {
    ensureOpen();

    std::string tempName = prefix + "_" + generateTempId() + suffix + ".tmp";
    return createOutput(tempName);
}

std::unique_ptr<IndexInput> FSDirectory::openInput(const std::string& name) const {
    ensureOpen();

    auto path = directory_ / name;
    if (!std::filesystem::exists(path)) {
        throw FileNotFoundException("File not found: " + name);
    }

    return std::make_unique<FSIndexInput>(path);
}

void FSDirectory::close() {
    closed_.store(true, std::memory_order_relaxed);
}

std::string FSDirectory::toString() const {
    return "FSDirectory@" + directory_.string();
}

std::string FSDirectory::generateTempId() const {
    static std::atomic<uint64_t> counter{0};
    return std::to_string(::getpid()) + "_" +
           std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

// ==================== FSIndexInput ====================

FSIndexInput::FSIndexInput(const std::filesystem::path& path, size_t bufferSize)
    : file_path_(path)
    , file_(path, std::ios::binary)
    , file_length_(0)
    , file_position_(0)
    , buffer_(bufferSize)
    , buffer_position_(0)
    , buffer_length_(0) {
    if (!file_.is_open()) {
        throw IOException("Failed to open file: " + path.string());
    }

    file_.seekg(0, std::ios::end);
    file_length_ = file_.tellg();
    file_.seekg(0, std::ios::beg);
}

uint8_t FSIndexInput::readByte() {
    if (buffer_position_ >= buffer_length_) {
        refillBuffer();
    }
    return buffer_[buffer_position_++];
}

void FSIndexInput::readBytes(uint8_t* buffer, size_t length) {
    size_t remaining = length;
    size_t offset = 0;

    while (remaining > 0) {
        if (buffer_position_ >= buffer_length_) {
            refillBuffer();
        }

        size_t toCopy = std::min(remaining, buffer_length_ - buffer_position_);
        std::memcpy(buffer + offset, buffer_.data() + buffer_position_, toCopy);
        buffer_position_ += toCopy;
        offset += toCopy;
        remaining -= toCopy;
    }
}

int64_t FSIndexInput::getFilePointer() const {
    return file_position_ - static_cast<int64_t>(buffer_length_ - buffer_position_);
}

void FSIndexInput::seek(int64_t pos) {
    if (pos < 0 || pos > length()) {
        throw IOException("Invalid seek position: " + std::to_string(pos));
    }

    int64_t bufferStart = file_position_ - static_cast<int64_t>(buffer_length_);
    if (pos >= bufferStart && pos < file_position_) {
        buffer_position_ = static_cast<size_t>(pos - bufferStart);
        return;
    }

    file_.clear();
    file_.seekg(pos, std::ios::beg);
    if (!file_) {
        throw IOException("Seek failed: " + file_path_.string());
    }
    file_position_ = pos;
    buffer_position_ = 0;
    buffer_length_ = 0;
}

std::unique_ptr<IndexInput> FSIndexInput::clone() const {
    auto cloned = std::make_unique<FSIndexInput>(file_path_, buffer_.size());
    cloned->seek(getFilePointer());
    return cloned;
}

std::string FSIndexInput::toString() const {
    return "FSIndexInput(" + file_path_.string() + ")";
}

void FSIndexInput::refillBuffer() {
    int64_t available = length() - getFilePointer();
    if (available <= 0) {
        throw EOFException("Read past EOF: " + file_path_.string());
    }

    size_t toRead = std::min(static_cast<size_t>(available), buffer_.size());
    file_.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(toRead));
    buffer_length_ = static_cast<size_t>(file_.gcount());
    buffer_position_ = 0;
    file_position_ += static_cast<int64_t>(buffer_length_);

    if (buffer_length_ == 0) {
        throw EOFException("Read past EOF: " + file_path_.string());
    }
}

// ==================== FSIndexOutput ====================

FSIndexOutput::FSIndexOutput(const std::filesystem::path& path, size_t bufferSize)
    : file_path_(path)
    , file_(path, std::ios::binary | std::ios::trunc)
    , file_position_(0)
    , buffer_(bufferSize)
    , buffer_position_(0) {
    if (!file_.is_open()) {
        throw IOException("Failed to create file: " + path.string());
    }
}

FSIndexOutput::~FSIndexOutput() {
    if (file_.is_open()) {
        try {
            close();
        } catch (const IOException& e) {
            std::cerr << "[FSIndexOutput] Failed to close " << file_path_.string() << ": "
                      << e.what() << std::endl;
        }
    }
}

void FSIndexOutput::writeByte(uint8_t b) {
    if (buffer_position_ >= buffer_.size()) {
        flushBuffer();
    }
    buffer_[buffer_position_++] = b;
}

void FSIndexOutput::writeBytes(const uint8_t* buffer, size_t length) {
    size_t remaining = length;
    size_t offset = 0;

    while (remaining > 0) {
        if (buffer_position_ >= buffer_.size()) {
            flushBuffer();
        }

        size_t toCopy = std::min(remaining, buffer_.size() - buffer_position_);
        std::memcpy(buffer_.data() + buffer_position_, buffer + offset, toCopy);
        buffer_position_ += toCopy;
        offset += toCopy;
        remaining -= toCopy;
    }
}

int64_t FSIndexOutput::getFilePointer() const {
    return file_position_ + static_cast<int64_t>(buffer_position_);
}

void FSIndexOutput::close() {
    if (file_.is_open()) {
        flushBuffer();
        file_.close();
        if (file_.fail()) {
            throw IOException("Close failed: " + file_path_.string());
        }
    }
}

void FSIndexOutput::flushBuffer() {
    if (buffer_position_ > 0) {
        file_.write(reinterpret_cast<const char*>(buffer_.data()),
                    static_cast<std::streamsize>(buffer_position_));
        if (!file_) {
            throw IOException("Write failed: " + file_path_.string());
        }
        file_position_ += static_cast<int64_t>(buffer_position_);
        buffer_position_ = 0;
    }
}

}  // namespace store
}  // namespace sieve
