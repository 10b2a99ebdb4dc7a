// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/store/Directory.h"
#include "sieve/store/IndexInput.h"
#include "sieve/store/IndexOutput.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace sieve {
namespace store {

/**
 * @brief Filesystem directory using buffered standard C++ streams.
 *
 * Based on: org.apache.lucene.store.FSDirectory
 *
 * Holds spilled sorter chunks. Chunks are scratch data that never outlive
 * the load that wrote them, so nothing here is fsynced.
 */
class FSDirectory : public Directory {
public:
    /**
     * @brief Opens a directory, creating it (and parents) if missing.
     */
    static std::unique_ptr<FSDirectory> open(const std::filesystem::path& path);

    /**
     * @param path Filesystem path (must exist)
     * @throws IOException if path is missing or not a directory
     */
    explicit FSDirectory(const std::filesystem::path& path);

    ~FSDirectory() override = default;

    // ==================== File Operations ====================

    void deleteFile(const std::string& name) override;

    bool fileExists(const std::string& name) const override;

    // ==================== Stream Creation ====================

    std::unique_ptr<IndexOutput> createTempOutput(const std::string& prefix,
                                                  const std::string& suffix) override;

    std::unique_ptr<IndexInput> openInput(const std::string& name) const override;

    // ==================== Lifecycle ====================

    void close() override;

    std::string toString() const override;

    const std::filesystem::path& path() const noexcept { return directory_; }

private:
    /**
     * @throws FileAlreadyExistsException if the file exists
     */
    std::unique_ptr<IndexOutput> createOutput(const std::string& name);

    std::string generateTempId() const;

    std::filesystem::path directory_;
};

/**
 * @brief Buffered file reader over std::ifstream.
 */
class FSIndexInput : public IndexInput {
public:
    /**
     * @param path File path
     * @param bufferSize Read buffer size (default 8KB)
     */
    explicit FSIndexInput(const std::filesystem::path& path, size_t bufferSize = 8192);

    ~FSIndexInput() override = default;

    // ==================== Reading ====================

    uint8_t readByte() override;

    void readBytes(uint8_t* buffer, size_t length) override;

    // ==================== Positioning ====================

    int64_t getFilePointer() const override;

    void seek(int64_t pos) override;

    int64_t length() const override { return file_length_; }

    // ==================== Cloning ====================

    std::unique_ptr<IndexInput> clone() const override;

    std::string toString() const override;

private:
    std::filesystem::path file_path_;
    std::ifstream file_;
    int64_t file_length_;
    int64_t file_position_;

    std::vector<uint8_t> buffer_;
    size_t buffer_position_;
    size_t buffer_length_;

    void refillBuffer();
};

/**
 * @brief Buffered file writer over std::ofstream.
 *
 * Destroying an unclosed output flushes it; a flush failure at that point
 * is reported on stderr since destructors cannot throw.
 */
class FSIndexOutput : public IndexOutput {
public:
    /**
     * @param path File path (truncated if it exists)
     * @param bufferSize Write buffer size (default 8KB)
     */
    explicit FSIndexOutput(const std::filesystem::path& path, size_t bufferSize = 8192);

    ~FSIndexOutput() override;

    // ==================== Writing ====================

    void writeByte(uint8_t b) override;

    void writeBytes(const uint8_t* buffer, size_t length) override;

    // ==================== Positioning ====================

    int64_t getFilePointer() const override;

    // ==================== Finalization ====================

    void close() override;

    std::string getName() const override { return file_path_.filename().string(); }

private:
    std::filesystem::path file_path_;
    std::ofstream file_;
    int64_t file_position_;

    std::vector<uint8_t> buffer_;
    size_t buffer_position_;

    void flushBuffer();
};

}  // namespace store
}  // namespace sieve
