#pragma once

#include <trello_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace trello_mcp {

constexpr const char* kMcpProtocolVersion = "2024-11-05";
constexpr const char* kMcpServerName = "trello-mcp";

// ---------------------------------------------------------------------------
// McpServer - MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - tools/list
//   - tools/call
//   - notifications/initialized (notification, no response)
//
// HandleMessage is const and shares only the read-only registry, so the
// HTTP transport calls it from its worker threads.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(const ToolRegistry& registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on stdin).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message) const;

    // The "initialize" result: protocol version, capabilities, serverInfo.
    [[nodiscard]] static nlohmann::json InitializeResult();

    [[nodiscard]] static nlohmann::json MakeError(const nlohmann::json& id,
                                                  int code,
                                                  const std::string& message);
    [[nodiscard]] static nlohmann::json MakeResult(const nlohmann::json& id,
                                                   const nlohmann::json& result);

private:
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id) const;

    const ToolRegistry& registry_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace trello_mcp
