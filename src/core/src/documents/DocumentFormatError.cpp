// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/documents/DocumentFormatError.h"

namespace sieve {
namespace documents {

namespace {
constexpr size_t KEEP_HEAD = 50;
constexpr size_t KEEP_TAIL = 85;
constexpr const char* ELLIPSIS = "...";
constexpr size_t MAX_UNTRUNCATED = 100 + 3;
}  // namespace

std::string DocumentFormatError::truncateParserMessage(const std::string& message) {
    if (message.size() <= MAX_UNTRUNCATED || message.size() - KEEP_TAIL < KEEP_HEAD) {
        return message;
    }
    std::string truncated = message;
    truncated.replace(KEEP_HEAD, message.size() - KEEP_TAIL - KEEP_HEAD, ELLIPSIS);
    return truncated;
}

DocumentFormatError DocumentFormatError::internal(PayloadType type, const std::string& message) {
    return DocumentFormatError(Kind::Internal, type,
                               "An internal error has occurred: `" + message + "`.");
}

DocumentFormatError DocumentFormatError::malformedJson(PayloadType type,
                                                       const std::string& parserMessage) {
    return DocumentFormatError(Kind::MalformedPayload, type,
                               "The `" + toString(type) +
                                   "` payload provided is malformed. `Couldn't serialize "
                                   "document value: " +
                                   truncateParserMessage(parserMessage) + "`.");
}

DocumentFormatError DocumentFormatError::malformed(PayloadType type, const std::string& message) {
    return DocumentFormatError(Kind::MalformedPayload, type,
                               "The `" + toString(type) + "` payload provided is malformed: `" +
                                   message + "`.");
}

}  // namespace documents
}  // namespace sieve
