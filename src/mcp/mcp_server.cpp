#include <trello_mcp/mcp/mcp_server.hpp>

#include <trello_mcp/core/log.hpp>
#include <trello_mcp/core/version.hpp>

#include <string>

namespace trello_mcp {

McpServer::McpServer(const ToolRegistry& registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(registry), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", "stdio server ready");
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty() || line == "\r") continue;

        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            LogWarn("mcp", "unparsable message dropped");
            out_ << MakeError(nullptr, -32700, "Parse error").dump() << "\n";
            out_.flush();
            continue;
        }

        auto response = HandleMessage(message);
        if (response) {
            out_ << response->dump() << "\n";
            out_.flush();
        }
    }
    LogInfo("mcp", "stdin closed, stopping");
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) const {
    // Check for JSON-RPC 2.0.
    if (!message.is_object() || !message.contains("jsonrpc") ||
        message["jsonrpc"] != "2.0") {
        if (message.is_object() && message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id".
    if (!message.contains("id")) {
        return std::nullopt;
    }

    const auto& id = message["id"];
    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        return MakeError(id, -32600, "Missing 'method'");
    }
    const auto method = method_it->get<std::string>();
    auto params = message.value("params", nlohmann::json::object());

    LogDebug("mcp", "request " + method);
    if (method == "initialize") {
        return MakeResult(id, InitializeResult());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else {
        return MakeError(id, -32601, "Method not found: " + method);
    }
}

nlohmann::json McpServer::InitializeResult() {
    nlohmann::json result;
    result["protocolVersion"] = kMcpProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", kMcpServerName},
        {"version", kVersion}
    };
    return result;
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) const {
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, -32602, "Unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace trello_mcp
