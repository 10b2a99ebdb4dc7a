// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include "sieve/documents/PayloadType.h"
#include "sieve/util/Exceptions.h"

#include <string>

namespace sieve {
namespace documents {

/**
 * @brief Failure while turning a payload into a documents batch.
 *
 * Internal errors come from the output side (I/O on the batch); malformed
 * payload errors come from the input and are reported back to the user, so
 * their message is formatted once here:
 *
 *   internal:       An internal error has occurred: `<msg>`.
 *   malformed JSON: The `json` payload provided is malformed. `Couldn't
 *                   serialize document value: <msg>`.
 *   malformed:      The `csv` payload provided is malformed: `<msg>`.
 *
 * Parser messages can quote the whole input line; JSON parser messages over
 * 103 bytes keep their first 50 and last 85 bytes around a "...".
 */
class DocumentFormatError : public SieveException {
public:
    enum class Kind : uint8_t { Internal, MalformedPayload };

    /**
     * @brief Failure writing the batch.
     */
    static DocumentFormatError internal(PayloadType type, const std::string& message);

    /**
     * @brief JSON syntax or shape error reported by the parser.
     */
    static DocumentFormatError malformedJson(PayloadType type, const std::string& parserMessage);

    /**
     * @brief Any other payload error (bad CSV number, ragged CSV row, ...).
     */
    static DocumentFormatError malformed(PayloadType type, const std::string& message);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    [[nodiscard]] PayloadType payloadType() const noexcept { return payloadType_; }

    /**
     * @brief Applies the parser message truncation: messages longer than
     * 103 bytes get bytes [50, len - 85) replaced by "...". Messages too
     * short to hold both kept ends are returned whole.
     */
    static std::string truncateParserMessage(const std::string& message);

private:
    DocumentFormatError(Kind kind, PayloadType type, const std::string& message)
        : SieveException(message)
        , kind_(kind)
        , payloadType_(type) {}

    Kind kind_;
    PayloadType payloadType_;
};

}  // namespace documents
}  // namespace sieve
