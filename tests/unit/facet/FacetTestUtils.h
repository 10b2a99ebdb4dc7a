// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/facet/FacetGroup.h"
#include "sieve/facet/FacetLevelsBuilder.h"
#include "sieve/kv/Environment.h"

#include <memory>
#include <utility>
#include <vector>

namespace sieve {
namespace facet {
namespace fixtures {

/**
 * An in-memory environment holding one facet database.
 */
struct FacetIndexFixture {
    std::unique_ptr<kv::Environment> env;
    kv::Database db;
};

/**
 * Field 0: value i (as f64) -> {i} for i in 0..256.
 */
FacetIndexFixture buildSimpleIndex(uint8_t groupSize = FacetLevelsBuilder::DEFAULT_GROUP_SIZE,
                                   uint8_t minLevelSize = FacetLevelsBuilder::DEFAULT_MIN_LEVEL_SIZE);

/**
 * Field 0: 128 random keys k drawn from 0..256 (as f64) -> {k, k + 100}.
 * Seeded, so every call builds the same index.
 */
FacetIndexFixture buildRandomIndex(uint8_t groupSize = FacetLevelsBuilder::DEFAULT_GROUP_SIZE,
                                   uint8_t minLevelSize = FacetLevelsBuilder::DEFAULT_MIN_LEVEL_SIZE);

/**
 * Field 0 as in buildSimpleIndex, field 1: value i -> {i + 1000} for i in 0..64.
 */
FacetIndexFixture buildTwoFieldIndex();

/**
 * Field 0: value i (as f64) -> {i} for i in 0..values, grouped by hand into
 * one level 1: a group of leadingSize children at value 0 (skipped when 0),
 * then a last group over the rest with FacetGroupValue::UNBOUNDED_SIZE.
 */
FacetIndexFixture buildUnboundedLastGroupIndex(uint32_t values, uint8_t leadingSize = 0);

/**
 * Level 0 entries of a field in ascending bound order.
 */
std::vector<std::pair<Bytes, DocIdBitmap>> levelZero(const kv::ReadTxn& rtxn,
                                                     const kv::Database& db, FieldId fieldId);

/**
 * The documents of every value, largest value first, as a brute force
 * reference for DescendingFacetSort.
 */
std::vector<DocIdBitmap> descendingReference(const kv::ReadTxn& rtxn, const kv::Database& db,
                                             FieldId fieldId, const DocIdBitmap& candidates);

}  // namespace fixtures
}  // namespace facet
}  // namespace sieve
