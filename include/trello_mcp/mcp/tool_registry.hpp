#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace trello_mcp {

// ---------------------------------------------------------------------------
// ToolSchema - name, description and JSON Schema of a tool's arguments.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult - result of executing a tool.
//
// content is an MCP content array holding one text block; the text is the
// tool's JSON string. is_error marks an error envelope.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks

    /// Text of the first content block, or "" when there is none.
    [[nodiscard]] std::string Text() const;
};

// A tool handler takes a JSON arguments object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& params)>;

// ---------------------------------------------------------------------------
// ToolRegistry - registry of MCP tools.
//
// Populated once at startup, read-only afterwards; Execute may be called
// from several threads at once.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] std::vector<std::string> Names() const;

    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Run a tool. Never throws: an unknown name or an exception escaping
    /// the handler becomes an {"error": ...} result.
    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& params) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace trello_mcp
