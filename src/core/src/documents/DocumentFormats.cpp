// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/documents/DocumentFormats.h"

#include "sieve/util/Exceptions.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <optional>
#include <vector>

namespace sieve {
namespace documents {

using Json = nlohmann::ordered_json;

namespace {

// ==================== CSV ====================

enum class CsvType { String, Number };

struct CsvColumn {
    std::string name;
    CsvType type;
};

CsvColumn parseCsvHeader(const std::string& header) {
    auto colon = header.rfind(':');
    if (colon != std::string::npos) {
        const std::string type = header.substr(colon + 1);
        if (type == "number") {
            return {header.substr(0, colon), CsvType::Number};
        }
        if (type == "string") {
            return {header.substr(0, colon), CsvType::String};
        }
    }
    return {header, CsvType::String};
}

/**
 * RFC 4180 record reader: comma separated, double-quote quoting with ""
 * escapes, quoted fields may span lines, CRLF or LF line ends.
 */
class CsvRecordReader {
public:
    explicit CsvRecordReader(std::istream& input)
        : input_(input) {}

    /**
     * @return false at end of input
     */
    bool next(std::vector<std::string>& fields) {
        fields.clear();
        int c = input_.get();
        if (c == std::char_traits<char>::eof()) {
            return false;
        }
        recordLine_ = line_;

        std::string field;
        bool quoted = false;
        bool wasQuoted = false;
        while (true) {
            if (c == std::char_traits<char>::eof()) {
                if (quoted) {
                    throw DocumentFormatError::malformed(
                        PayloadType::Csv, "CSV error: unterminated quoted field starting at line " +
                                              std::to_string(recordLine_));
                }
                fields.push_back(std::move(field));
                return true;
            }
            const char ch = static_cast<char>(c);
            if (quoted) {
                if (ch == '"') {
                    if (input_.peek() == '"') {
                        input_.get();
                        field.push_back('"');
                    } else {
                        quoted = false;
                    }
                } else {
                    if (ch == '\n') {
                        line_++;
                    }
                    field.push_back(ch);
                }
            } else if (ch == '"' && field.empty() && !wasQuoted) {
                quoted = true;
                wasQuoted = true;
            } else if (ch == ',') {
                fields.push_back(std::move(field));
                field.clear();
                wasQuoted = false;
            } else if (ch == '\r' && input_.peek() == '\n') {
                // CRLF, the '\n' ends the record
            } else if (ch == '\n') {
                line_++;
                fields.push_back(std::move(field));
                return true;
            } else {
                field.push_back(ch);
            }
            c = input_.get();
        }
    }

    /**
     * @brief 1-based line on which the last record started.
     */
    [[nodiscard]] uint64_t recordLine() const noexcept { return recordLine_; }

private:
    std::istream& input_;
    uint64_t line_ = 1;
    uint64_t recordLine_ = 1;
};

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

Json parseCsvNumber(const std::string& raw, uint64_t line) {
    const std::string value = trim(raw);
    if (value.empty()) {
        return Json(nullptr);
    }

    int64_t integer = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), integer);
    if (ec == std::errc() && ptr == value.data() + value.size()) {
        return Json(integer);
    }

    char* end = nullptr;
    const double real = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || !std::isfinite(real)) {
        throw DocumentFormatError::malformed(PayloadType::Csv,
                                             "Error parsing number \"" + raw + "\" at line " +
                                                 std::to_string(line) +
                                                 ": invalid float literal");
    }
    return Json(real);
}

// ==================== JSON ====================

void appendJsonObject(DocumentsBatchBuilder& builder, const Json& object, PayloadType type) {
    if (!object.is_object()) {
        throw DocumentFormatError::malformedJson(
            type, std::string("invalid type: ") + object.type_name() + ", expected a map");
    }
    DocumentsBatchBuilder::FieldValues fields;
    fields.reserve(object.size());
    for (const auto& [name, value] : object.items()) {
        fields.emplace_back(name, value.dump());
    }
    builder.appendDocument(fields);
}

size_t finishBatch(DocumentsBatchBuilder& builder, PayloadType type) {
    try {
        return static_cast<size_t>(builder.finish());
    } catch (const IOException& e) {
        throw DocumentFormatError::internal(type, e.what());
    }
}

}  // namespace

size_t readCsv(std::istream& input, store::IndexOutput& output) {
    try {
        DocumentsBatchBuilder builder(output);
        CsvRecordReader reader(input);

        std::vector<std::string> row;
        std::vector<CsvColumn> columns;
        if (reader.next(row)) {
            for (const auto& header : row) {
                columns.push_back(parseCsvHeader(header));
                builder.declareField(columns.back().name);
            }
        }

        uint64_t record = 1;
        while (reader.next(row)) {
            record++;
            if (row.size() == 1 && row[0].empty() && columns.size() != 1) {
                continue;
            }
            if (row.size() != columns.size()) {
                throw DocumentFormatError::malformed(
                    PayloadType::Csv,
                    "CSV error: record " + std::to_string(record) + " (line: " +
                        std::to_string(reader.recordLine()) + ") has " +
                        std::to_string(row.size()) + " fields, but the header has " +
                        std::to_string(columns.size()) + " fields");
            }

            DocumentsBatchBuilder::FieldValues fields;
            fields.reserve(columns.size());
            for (size_t i = 0; i < columns.size(); i++) {
                const Json value = columns[i].type == CsvType::Number
                                       ? parseCsvNumber(row[i], reader.recordLine())
                                       : Json(row[i]);
                fields.emplace_back(columns[i].name, value.dump());
            }
            builder.appendDocument(fields);
        }

        if (input.bad()) {
            throw DocumentFormatError::internal(PayloadType::Csv, "failed to read CSV input");
        }
        return finishBatch(builder, PayloadType::Csv);
    } catch (const IOException& e) {
        throw DocumentFormatError::internal(PayloadType::Csv, e.what());
    }
}

size_t readNdjson(std::istream& input, store::IndexOutput& output) {
    try {
        DocumentsBatchBuilder builder(output);
        std::string line;
        while (std::getline(input, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            Json object;
            try {
                object = Json::parse(line);
            } catch (const Json::parse_error& e) {
                throw DocumentFormatError::malformedJson(PayloadType::Ndjson, e.what());
            }
            appendJsonObject(builder, object, PayloadType::Ndjson);
        }

        if (input.bad()) {
            throw DocumentFormatError::internal(PayloadType::Ndjson, "failed to read NDJSON input");
        }
        return finishBatch(builder, PayloadType::Ndjson);
    } catch (const IOException& e) {
        throw DocumentFormatError::internal(PayloadType::Ndjson, e.what());
    }
}

size_t readJson(std::istream& input, store::IndexOutput& output) {
    std::string payload((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw DocumentFormatError::internal(PayloadType::Json, "failed to read JSON input");
    }

    Json parsed;
    try {
        parsed = Json::parse(payload);
    } catch (const Json::parse_error& e) {
        throw DocumentFormatError::malformedJson(PayloadType::Json, e.what());
    }

    if (parsed.is_array()) {
        for (const auto& element : parsed) {
            if (!element.is_object()) {
                throw DocumentFormatError::malformedJson(
                    PayloadType::Json,
                    std::string("invalid type: ") + element.type_name() + ", expected a map");
            }
        }
    } else if (!parsed.is_object()) {
        throw DocumentFormatError::malformedJson(
            PayloadType::Json, std::string("invalid type: ") + parsed.type_name() +
                                   ", expected a map or a sequence of maps");
    }

    try {
        DocumentsBatchBuilder builder(output);
        if (parsed.is_array()) {
            for (const auto& element : parsed) {
                appendJsonObject(builder, element, PayloadType::Json);
            }
        } else {
            appendJsonObject(builder, parsed, PayloadType::Json);
        }
        return finishBatch(builder, PayloadType::Json);
    } catch (const IOException& e) {
        throw DocumentFormatError::internal(PayloadType::Json, e.what());
    }
}

std::string recordToJson(const DocumentsBatchReader& batch, ByteSpan record) {
    Json object = Json::object();
    for (const auto& [name, value] : batch.toFieldValues(record)) {
        try {
            object[name] = Json::parse(value);
        } catch (const Json::parse_error& e) {
            throw CorruptIndexException("Stored value of field \"" + name +
                                        "\" is not JSON: " + e.what());
        }
    }
    return object.dump();
}

}  // namespace documents
}  // namespace sieve
