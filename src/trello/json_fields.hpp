#pragma once

#include <trello_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace trello_mcp::json_fields {

// Where a record came from, for MalformedResponse errors.
struct Source {
    std::string_view operation;
    std::string_view endpoint;
};

inline Error MakeMalformed(const Source& src, const std::string& message) {
    return Error::Malformed(std::string(src.operation), std::string(src.endpoint),
                            message);
}

// A required string field. Absent or non-string is a malformed response.
inline Result<std::string, Error> RequireString(const nlohmann::json& record,
                                                const char* field,
                                                const Source& src) {
    if (!record.is_object()) {
        return Result<std::string, Error>::Err(
            MakeMalformed(src, "Expected a JSON object record"));
    }
    auto it = record.find(field);
    if (it == record.end() || !it->is_string()) {
        return Result<std::string, Error>::Err(
            MakeMalformed(src, std::string("Missing required field '") + field + "'"));
    }
    return Result<std::string, Error>::Ok(it->get<std::string>());
}

// An optional string field; absent, null or non-string yields fallback.
inline std::string OptString(const nlohmann::json& record, const char* field,
                             const std::string& fallback = "") {
    if (!record.is_object()) return fallback;
    auto it = record.find(field);
    if (it != record.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

// An optional string field whose absence is reported, not defaulted.
inline std::optional<std::string> OptNullableString(const nlohmann::json& record,
                                                    const char* field) {
    if (!record.is_object()) return std::nullopt;
    auto it = record.find(field);
    if (it != record.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

// True only for the JSON literal true. Absent, false, "true", 1 -> false.
inline bool IsLiterallyTrue(const nlohmann::json& record, const char* field) {
    if (!record.is_object()) return false;
    auto it = record.find(field);
    return it != record.end() && it->is_boolean() && it->get<bool>();
}

inline Result<void, Error> RequireArray(const nlohmann::json& body,
                                        const Source& src) {
    if (!body.is_array()) {
        return Result<void, Error>::Err(MakeMalformed(
            src, std::string("Expected a JSON array, got ") + body.type_name()));
    }
    return Result<void, Error>::Ok();
}

inline Result<void, Error> RequireObject(const nlohmann::json& body,
                                         const Source& src) {
    if (!body.is_object()) {
        return Result<void, Error>::Err(MakeMalformed(
            src, std::string("Expected a JSON object, got ") + body.type_name()));
    }
    return Result<void, Error>::Ok();
}

} // namespace trello_mcp::json_fields
