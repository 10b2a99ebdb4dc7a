// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace sieve {
namespace documents {

/**
 * Wire format of an ingested documents payload.
 */
enum class PayloadType : uint8_t { Ndjson, Json, Csv };

inline std::string toString(PayloadType type) {
    switch (type) {
        case PayloadType::Ndjson:
            return "ndjson";
        case PayloadType::Json:
            return "json";
        case PayloadType::Csv:
            return "csv";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, PayloadType type) {
    return os << toString(type);
}

}  // namespace documents
}  // namespace sieve
