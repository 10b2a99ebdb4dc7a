// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/extsort/MergeFunction.h"

namespace sieve {
namespace extsort {

/**
 * Last value wins.
 */
class KeepLatestMerge : public MergeFunction {
public:
    Bytes merge(ByteSpan key, const std::vector<ByteSpan>& values) const override;

    std::string getName() const override { return "keep-latest"; }

    static MergeFunctionPtr create();
};

/**
 * First value wins.
 */
class KeepFirstMerge : public MergeFunction {
public:
    Bytes merge(ByteSpan key, const std::vector<ByteSpan>& values) const override;

    std::string getName() const override { return "keep-first"; }

    static MergeFunctionPtr create();
};

/**
 * All values must be byte-identical; anything else is a conflict.
 *
 * Used for data where a second, different value for the same key is a bug
 * upstream (e.g. two external ids mapped to one document).
 */
class RequireIdenticalMerge : public MergeFunction {
public:
    Bytes merge(ByteSpan key, const std::vector<ByteSpan>& values) const override;

    std::string getName() const override { return "require-identical"; }

    static MergeFunctionPtr create();
};

/**
 * Values are serialized DocIdBitmaps; the result is their union.
 */
class UnionBitmapMerge : public MergeFunction {
public:
    Bytes merge(ByteSpan key, const std::vector<ByteSpan>& values) const override;

    std::string getName() const override { return "union-bitmap"; }

    static MergeFunctionPtr create();
};

}  // namespace extsort
}  // namespace sieve
