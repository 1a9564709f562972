#include <trello_mcp/core/types.hpp>

#include <algorithm>

namespace trello_mcp {

namespace {

constexpr size_t kMaxResourceIdLength = 64;

bool IsForbiddenIdChar(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u <= 0x20 || u == 0x7F ||
           c == '/' || c == '?' || c == '#' || c == '%';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ResourceId
// ---------------------------------------------------------------------------
Result<ResourceId, std::string> ResourceId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<ResourceId, std::string>::Err("Identifier must not be empty");
    }
    if (id.size() > kMaxResourceIdLength) {
        return Result<ResourceId, std::string>::Err(
            "Identifier must be at most " + std::to_string(kMaxResourceIdLength) +
            " characters, got " + std::to_string(id.size()));
    }
    if (std::any_of(id.begin(), id.end(), IsForbiddenIdChar)) {
        return Result<ResourceId, std::string>::Err(
            "Identifier must not contain whitespace or any of '/', '?', '#', '%'");
    }
    return Result<ResourceId, std::string>::Ok(ResourceId(std::string(id)));
}

} // namespace trello_mcp
