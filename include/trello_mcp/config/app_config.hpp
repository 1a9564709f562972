#pragma once

#include <trello_mcp/core/log.hpp>
#include <trello_mcp/trello/trello_client.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace trello_mcp {

enum class Transport {
    Stdio,
    Http,
};

enum class Command {
    Serve,  // run the MCP server on the configured transport
    Tools,  // print tool names
    Call,   // invoke one tool and print its JSON
};

struct ServerConfig {
    Transport transport = Transport::Stdio;
    std::string host = "127.0.0.1";
    uint16_t port = 3000;
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool json = false;
    std::optional<bool> color;  // unset: color when stderr is a TTY
};

struct AppConfig {
    ServerConfig server;
    LogConfig log;
    std::string api_key_env = "TRELLO_API_KEY";
    std::string token_env = "TRELLO_TOKEN";
    TrelloCredentials credentials;  // filled from the environment only
};

// ---------------------------------------------------------------------------
// CliOptions - what the command line says. Unset fields leave the YAML or
// default value in place.
// ---------------------------------------------------------------------------
struct CliOptions {
    Command command = Command::Serve;
    std::optional<std::string> config_file;
    std::optional<std::string> env_file;
    std::optional<Transport> transport;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<LogLevel> log_level;
    std::optional<bool> log_json;
    bool no_color = false;
    bool show_version = false;
    std::string call_tool;
    std::string call_args = "{}";
};

} // namespace trello_mcp
