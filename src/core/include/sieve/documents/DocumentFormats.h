// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/documents/DocumentFormatError.h"
#include "sieve/documents/DocumentsBatch.h"
#include "sieve/store/IndexOutput.h"

#include <cstddef>
#include <istream>
#include <string>

namespace sieve {
namespace documents {

/**
 * Payload readers: parse user input and write it as a canonical documents
 * batch into output, field values stored as JSON text. Each returns the
 * number of documents written.
 *
 * The output is left open; the caller closes it once the batch is complete.
 * A DocumentFormatError aborts the reader: the documents written so far stay
 * in output and the batch is not finished, so it must be discarded.
 */

/**
 * @brief Reads CSV with a header row.
 *
 * A header "name:number" makes the column numeric (empty cells become null,
 * anything else must parse as a number); "name:string" or a plain header is
 * a string column.
 *
 * @throws DocumentFormatError
 */
size_t readCsv(std::istream& input, store::IndexOutput& output);

/**
 * @brief Reads one JSON object per line, blank lines skipped.
 * @throws DocumentFormatError
 */
size_t readNdjson(std::istream& input, store::IndexOutput& output);

/**
 * @brief Reads a single JSON object or an array of objects.
 * @throws DocumentFormatError
 */
size_t readJson(std::istream& input, store::IndexOutput& output);

/**
 * @brief Renders a record of a batch back as a JSON object.
 * @throws CorruptIndexException if a stored value is not valid JSON
 */
std::string recordToJson(const DocumentsBatchReader& batch, ByteSpan record);

}  // namespace documents
}  // namespace sieve
