// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/util/Bytes.h"

namespace sieve {
namespace extsort {

/**
 * @brief A strictly ascending, duplicate-free stream of key/value pairs.
 *
 * key() and value() are valid after next() returned true and until the
 * following call to next().
 */
class MergeSource {
public:
    virtual ~MergeSource() = default;

    /**
     * @return false once the stream is exhausted
     */
    virtual bool next() = 0;

    virtual util::ByteSpan key() const = 0;

    virtual util::ByteSpan value() const = 0;
};

}  // namespace extsort
}  // namespace sieve
