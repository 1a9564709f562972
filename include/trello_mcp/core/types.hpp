#pragma once

#include <trello_mcp/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace trello_mcp {

// ---------------------------------------------------------------------------
// ResourceId - opaque board/list/card identifier spliced into a URL path.
//
// Rules:
//   - Non-empty, max 64 characters
//   - No whitespace or control characters
//   - No '/', '?', '#', '%' (would change the endpoint being addressed)
//
// Both 24-hex object ids and 8-char board short links pass.
// ---------------------------------------------------------------------------
class ResourceId {
public:
    static Result<ResourceId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ResourceId& other) const { return value_ == other.value_; }
    bool operator!=(const ResourceId& other) const { return value_ != other.value_; }

    ResourceId(const ResourceId&) = default;
    ResourceId& operator=(const ResourceId&) = default;
    ResourceId(ResourceId&&) noexcept = default;
    ResourceId& operator=(ResourceId&&) noexcept = default;

private:
    explicit ResourceId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace trello_mcp

namespace std {

template <>
struct hash<trello_mcp::ResourceId> {
    size_t operator()(const trello_mcp::ResourceId& id) const noexcept {
        return hash<string>{}(id.Value());
    }
};

} // namespace std
