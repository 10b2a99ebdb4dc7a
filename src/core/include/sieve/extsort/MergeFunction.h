// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/util/Bytes.h"

#include <memory>
#include <string>
#include <vector>

namespace sieve {
namespace extsort {

using util::Bytes;
using util::ByteSpan;

/**
 * @brief Strategy combining the values that collide on one key.
 *
 * The same function runs inside a sorter chunk, across chunks in the
 * merger and against the value already persisted in the store, so it must
 * give the same result however the values were grouped beforehand:
 * merge(k, [merge(k, [a, b]), c]) == merge(k, [a, b, c]).
 *
 * Values arrive in insertion / source order. Implementations must be
 * thread-safe; one instance is shared by every sorter of a parallel build.
 */
class MergeFunction {
public:
    virtual ~MergeFunction() = default;

    /**
     * @param key The colliding key
     * @param values At least two values, oldest first
     * @return The merged value
     * @throws MergeConflictException if the values cannot be combined
     */
    virtual Bytes merge(ByteSpan key, const std::vector<ByteSpan>& values) const = 0;

    /**
     * Name used in diagnostics
     */
    virtual std::string getName() const = 0;
};

using MergeFunctionPtr = std::shared_ptr<const MergeFunction>;

}  // namespace extsort
}  // namespace sieve
