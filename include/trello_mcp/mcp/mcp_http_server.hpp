#pragma once

#include <trello_mcp/core/result.hpp>
#include <trello_mcp/mcp/mcp_server.hpp>
#include <trello_mcp/mcp/tool_registry.hpp>

#include <memory>
#include <string>

namespace trello_mcp {

// Presence of the upstream credentials, reported by GET /health.
struct CredentialStatus {
    bool api_key_set = false;
    bool token_set = false;
};

// ---------------------------------------------------------------------------
// McpHttpServer - the MCP dispatcher served over HTTP with cpp-httplib.
//
//   POST /mcp     JSON-RPC request -> response; notification -> 202
//   GET  /mcp     discovery: initialize result with id null
//   GET  /tools   {"tools": [names], "count", "description"}
//   GET  /        {"message", "version", "endpoints"}
//   GET  /health  {"status": "OK", "trello": {"apiKey", "token"}}
//
// Requests run on httplib's worker threads and share the read-only
// dispatcher and registry.
// ---------------------------------------------------------------------------
class McpHttpServer {
public:
    McpHttpServer(const McpServer& dispatcher,
                  const ToolRegistry& registry,
                  CredentialStatus credentials);
    ~McpHttpServer();

    McpHttpServer(const McpHttpServer&) = delete;
    McpHttpServer& operator=(const McpHttpServer&) = delete;

    /// Bind to host:port. Port 0 picks a free port. Returns the bound port.
    [[nodiscard]] Result<int, Error> Bind(const std::string& host, int port);

    /// Serve until Stop() is called. Bind first.
    [[nodiscard]] Result<void, Error> Listen();

    void WaitUntilReady() const;
    void Stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace trello_mcp
