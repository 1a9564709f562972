#include <trello_mcp/config/config_loader.hpp>

#include <trello_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <limits>

namespace trello_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string Unquote(const std::string& value) {
    if (value.size() >= 2 &&
        (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

Result<Transport, Error> ParseTransport(const std::string& name) {
    if (name == "stdio") return Result<Transport, Error>::Ok(Transport::Stdio);
    if (name == "http") return Result<Transport, Error>::Ok(Transport::Http);
    return Result<Transport, Error>::Err(
        MakeConfigError("Invalid transport '" + name + "' (expected stdio or http)"));
}

Result<bool, Error> ParseLogFormat(const std::string& name) {
    if (name == "text") return Result<bool, Error>::Ok(false);
    if (name == "json") return Result<bool, Error>::Ok(true);
    return Result<bool, Error>::Err(
        MakeConfigError("Invalid log format '" + name + "' (expected text or json)"));
}

Result<uint16_t, Error> ParsePort(int value) {
    if (value < 1 || value > std::numeric_limits<uint16_t>::max()) {
        return Result<uint16_t, Error>::Err(
            MakeConfigError("Invalid port: " + std::to_string(value)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadDotEnv
// ---------------------------------------------------------------------------
Result<std::size_t, Error> LoadDotEnv(std::string_view file_path, bool required) {
    std::ifstream in{std::string(file_path)};
    if (!in) {
        if (required) {
            return Result<std::size_t, Error>::Err(
                MakeConfigError("Cannot open env file: " + std::string(file_path)));
        }
        return Result<std::size_t, Error>::Ok(0);
    }

    std::size_t set_count = 0;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto text = Trim(line);
        if (text.empty() || text.front() == '#') continue;
        if (text.rfind("export ", 0) == 0) {
            text = Trim(text.substr(7));
        }

        const auto eq = text.find('=');
        if (eq == std::string::npos || eq == 0) {
            LogWarn("config", std::string(file_path) + ":" + std::to_string(line_no) +
                                  ": ignoring line without KEY=VALUE");
            continue;
        }
        const auto key = Trim(text.substr(0, eq));
        const auto value = Unquote(Trim(text.substr(eq + 1)));
        if (std::getenv(key.c_str()) != nullptr) continue;
        if (::setenv(key.c_str(), value.c_str(), 0) != 0) {
            return Result<std::size_t, Error>::Err(
                MakeConfigError("Cannot set environment variable '" + key + "'"));
        }
        ++set_count;
    }
    LogDebug("config", "loaded " + std::to_string(set_count) + " variable(s) from " +
                           std::string(file_path));
    return Result<std::size_t, Error>::Ok(set_count);
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (!root.IsNull() && !root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config file must contain a YAML mapping"));
        }

        // -- Server --
        if (const auto server = root["server"]) {
            if (server["transport"]) {
                auto transport = ParseTransport(server["transport"].as<std::string>());
                if (transport.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(transport).Error());
                }
                config.server.transport = transport.Value();
            }
            if (server["host"]) {
                config.server.host = server["host"].as<std::string>();
            }
            if (server["port"]) {
                auto port = ParsePort(server["port"].as<int>());
                if (port.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(port).Error());
                }
                config.server.port = port.Value();
            }
        }

        // -- Log --
        if (const auto log = root["log"]) {
            if (log["level"]) {
                auto name = log["level"].as<std::string>();
                auto level = ParseLogLevel(name);
                if (!level) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Invalid log level '" + name + "'"));
                }
                config.log.level = *level;
            }
            if (log["format"]) {
                auto json = ParseLogFormat(log["format"].as<std::string>());
                if (json.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(json).Error());
                }
                config.log.json = json.Value();
            }
            if (log["color"]) {
                config.log.color = log["color"].as<bool>();
            }
        }

        // -- Trello --
        if (const auto trello = root["trello"]) {
            if (trello["api_key"] || trello["token"]) {
                return Result<AppConfig, Error>::Err(MakeConfigError(
                    "Credentials are not read from the config file; "
                    "set them in the environment"));
            }
            if (trello["api_key_env"]) {
                config.api_key_env = trello["api_key_env"].as<std::string>();
            }
            if (trello["token_env"]) {
                config.token_env = trello["token_env"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("trello-mcp", kVersion,
                                     argparse::default_arguments::help);
    program.add_description("MCP server exposing Trello boards, lists and cards as tools.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--env-file")
        .help("Path to dotenv file (default: ./.env if present)");
    program.add_argument("-v")
        .help("Info logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-format")
        .help("Log format: text or json");
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser mcp_cmd("mcp", kVersion, argparse::default_arguments::help);
    mcp_cmd.add_description("Serve MCP over stdin/stdout (default)");

    argparse::ArgumentParser serve_cmd("serve", kVersion, argparse::default_arguments::help);
    serve_cmd.add_description("Serve MCP over HTTP");
    serve_cmd.add_argument("--host")
        .help("Listen address (default: 127.0.0.1)");
    serve_cmd.add_argument("--port")
        .help("Listen port (default: 3000)")
        .scan<'i', int>();

    argparse::ArgumentParser tools_cmd("tools", kVersion, argparse::default_arguments::help);
    tools_cmd.add_description("Print the names of the available tools");

    argparse::ArgumentParser call_cmd("call", kVersion, argparse::default_arguments::help);
    call_cmd.add_description("Invoke one tool and print its JSON result");
    call_cmd.add_argument("tool")
        .help("Tool name");
    call_cmd.add_argument("args")
        .help("Tool arguments as a JSON object")
        .default_value(std::string("{}"))
        .nargs(argparse::nargs_pattern::optional);

    program.add_subparser(mcp_cmd);
    program.add_subparser(serve_cmd);
    program.add_subparser(tools_cmd);
    program.add_subparser(call_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;

    if (auto val = program.present("--config")) {
        options.config_file = *val;
    }
    if (auto val = program.present("--env-file")) {
        options.env_file = *val;
    }
    if (program.get<bool>("-vv")) {
        options.log_level = LogLevel::Debug;
    } else if (program.get<bool>("-v")) {
        options.log_level = LogLevel::Info;
    }
    if (auto val = program.present("--log-format")) {
        auto json = ParseLogFormat(*val);
        if (json.IsErr()) {
            return Result<CliOptions, Error>::Err(std::move(json).Error());
        }
        options.log_json = json.Value();
    }
    options.no_color = program.get<bool>("--no-color");
    options.show_version = program.get<bool>("--version");

    if (program.is_subcommand_used(mcp_cmd)) {
        options.transport = Transport::Stdio;
    } else if (program.is_subcommand_used(serve_cmd)) {
        options.transport = Transport::Http;
        if (auto val = serve_cmd.present("--host")) {
            options.host = *val;
        }
        if (auto val = serve_cmd.present<int>("--port")) {
            auto port = ParsePort(*val);
            if (port.IsErr()) {
                return Result<CliOptions, Error>::Err(std::move(port).Error());
            }
            options.port = port.Value();
        }
    } else if (program.is_subcommand_used(tools_cmd)) {
        options.command = Command::Tools;
    } else if (program.is_subcommand_used(call_cmd)) {
        options.command = Command::Call;
        options.call_tool = call_cmd.get<std::string>("tool");
        options.call_args = call_cmd.get<std::string>("args");
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliOptions& cli_overrides) {
    AppConfig merged = yaml_base;

    if (cli_overrides.transport.has_value()) {
        merged.server.transport = *cli_overrides.transport;
    }
    if (cli_overrides.host.has_value()) {
        merged.server.host = *cli_overrides.host;
    }
    if (cli_overrides.port.has_value()) {
        merged.server.port = *cli_overrides.port;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log.level = *cli_overrides.log_level;
    }
    if (cli_overrides.log_json.has_value()) {
        merged.log.json = *cli_overrides.log_json;
    }
    if (cli_overrides.no_color) {
        merged.log.color = false;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveCredentials
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveCredentials(AppConfig config) {
    std::string missing;
    auto read = [&missing](const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            missing += missing.empty() ? name : ", " + name;
            return std::string();
        }
        return std::string(value);
    };

    config.credentials.api_key = read(config.api_key_env);
    config.credentials.token = read(config.token_env);
    if (!missing.empty()) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            "Missing Trello credentials: " + missing +
            " must be set in the environment or a .env file"));
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.api_key_env.empty() || config.token_env.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Credential variable names must not be empty"));
    }
    if (config.credentials.api_key.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required value: " + config.api_key_env));
    }
    if (config.credentials.token.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required value: " + config.token_env));
    }
    if (config.server.transport == Transport::Http) {
        if (config.server.host.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Missing required field: host"));
        }
        if (config.server.port == 0) {
            return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace trello_mcp
