#include <trello_mcp/mcp/tool_registry.hpp>

#include <trello_mcp/core/log.hpp>

namespace trello_mcp {

namespace {

ToolResult MakeFailure(const std::string& message) {
    nlohmann::json envelope = {{"error", message}};
    return ToolResult{
        true,
        nlohmann::json::array({{{"type", "text"}, {"text", envelope.dump()}}})};
}

} // namespace

std::string ToolResult::Text() const {
    if (!content.is_array() || content.empty()) {
        return "";
    }
    const auto& block = content.front();
    if (!block.is_object()) {
        return "";
    }
    auto it = block.find("text");
    if (it == block.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

std::vector<std::string> ToolRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& schema : schemas_) {
        names.push_back(schema.name);
    }
    return names;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                  const nlohmann::json& params) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return MakeFailure("Unknown tool: " + name);
    }

    LogDebug("mcp", "execute " + name);
    try {
        return it->second(params);
    } catch (const std::exception& e) {
        LogError("mcp", name + " raised: " + e.what());
        return MakeFailure(std::string("Tool error: ") + e.what());
    }
}

} // namespace trello_mcp
