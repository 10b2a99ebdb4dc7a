// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <stdexcept>
#include <string>

namespace sieve {

/**
 * @brief Base exception class for all Sieve exceptions.
 */
class SieveException : public std::runtime_error {
public:
    explicit SieveException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Thrown when reading or writing the store or a chunk file fails.
 */
class IOException : public SieveException {
public:
    explicit IOException(const std::string& message)
        : SieveException(message) {}
};

/**
 * @brief Thrown when a file is not found.
 */
class FileNotFoundException : public IOException {
public:
    explicit FileNotFoundException(const std::string& message)
        : IOException(message) {}
};

/**
 * @brief Thrown when attempting to create a file that already exists.
 */
class FileAlreadyExistsException : public IOException {
public:
    explicit FileAlreadyExistsException(const std::string& message)
        : IOException(message) {}
};

/**
 * @brief Thrown when attempting to read beyond EOF.
 */
class EOFException : public IOException {
public:
    explicit EOFException(const std::string& message)
        : IOException(message) {}
};

/**
 * @brief Thrown when persisted bytes cannot be decoded (bad key, value or chunk layout).
 */
class CorruptIndexException : public IOException {
public:
    explicit CorruptIndexException(const std::string& message)
        : IOException(message) {}
};

/**
 * @brief Thrown when an operation is attempted on a closed resource.
 */
class AlreadyClosedException : public SieveException {
public:
    explicit AlreadyClosedException(const std::string& message)
        : SieveException(message) {}
};

/**
 * @brief Thrown when a merge function refuses to combine conflicting values.
 *
 * Fatal for the enclosing write transaction.
 */
class MergeConflictException : public SieveException {
public:
    explicit MergeConflictException(const std::string& message)
        : SieveException(message) {}
};

/**
 * @brief Thrown when a read fails in the middle of a facet traversal.
 *
 * The iterator that raised it is exhausted afterwards.
 */
class IterationException : public SieveException {
public:
    explicit IterationException(const std::string& message)
        : SieveException(message) {}
};

}  // namespace sieve
