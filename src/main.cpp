#include <trello_mcp/config/config_loader.hpp>
#include <trello_mcp/core/log.hpp>
#include <trello_mcp/core/terminal.hpp>
#include <trello_mcp/core/version.hpp>
#include <trello_mcp/mcp/mcp_http_server.hpp>
#include <trello_mcp/mcp/mcp_server.hpp>
#include <trello_mcp/mcp/mcp_tool_handlers.hpp>
#include <trello_mcp/trello/http_session.hpp>
#include <trello_mcp/trello/trello_client.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess   = 0;
constexpr int kExitToolError = 1;

// Fatal errors go to stderr; with --log-format json they are structured.
int PrintError(const trello_mcp::Error& error, bool json = false) {
    if (json) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
    return error.ExitCode();
}

bool EnvIsSet(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value != nullptr && *value != '\0';
}

const char* Presence(bool set) {
    return set ? "Set" : "Missing";
}

void InitLogging(const trello_mcp::LogConfig& log) {
    using namespace trello_mcp;
    if (log.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(), log.level);
        return;
    }
    bool use_color = log.color.value_or(IsStderrTty()) && !NoColorEnvSet();
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), log.level);
}

int HandleTools(const trello_mcp::ToolRegistry& registry) {
    for (const auto& name : registry.Names()) {
        std::cout << name << "\n";
    }
    return kExitSuccess;
}

int HandleCall(const trello_mcp::ToolRegistry& registry,
               const std::string& tool, const std::string& raw_args) {
    using namespace trello_mcp;
    auto args = nlohmann::json::parse(raw_args, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        return PrintError(Error{"call", "", std::nullopt,
                                "Tool arguments must be a JSON object",
                                std::nullopt, ErrorCategory::InvalidArgument});
    }
    if (!registry.HasTool(tool)) {
        return PrintError(Error{"call", "", std::nullopt,
                                "Unknown tool: " + tool,
                                std::nullopt, ErrorCategory::InvalidArgument});
    }

    auto result = registry.Execute(tool, args);
    std::cout << result.Text() << "\n";
    return result.is_error ? kExitToolError : kExitSuccess;
}

int HandleHttp(const trello_mcp::AppConfig& config,
               const trello_mcp::ToolRegistry& registry) {
    using namespace trello_mcp;
    McpServer dispatcher(registry);
    McpHttpServer server(dispatcher, registry,
                         CredentialStatus{!config.credentials.api_key.empty(),
                                          !config.credentials.token.empty()});
    auto bound = server.Bind(config.server.host, config.server.port);
    if (bound.IsErr()) {
        return PrintError(bound.Error(), config.log.json);
    }
    auto served = server.Listen();
    if (served.IsErr()) {
        return PrintError(served.Error(), config.log.json);
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace trello_mcp;

    // Step 1: Parse CLI args (argparse prints --help itself).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return PrintError(cli_result.Error());
    }
    const auto cli = std::move(cli_result).Value();

    if (cli.show_version) {
        std::cout << "trello-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    // Step 2: YAML config under CLI overrides.
    AppConfig base;
    if (cli.config_file) {
        auto yaml_result = LoadFromYaml(*cli.config_file);
        if (yaml_result.IsErr()) {
            return PrintError(yaml_result.Error(), cli.log_json.value_or(false));
        }
        base = std::move(yaml_result).Value();
    }
    auto config = MergeConfigs(base, cli);

    // Step 3: Logging. Always stderr; stdout carries the protocol.
    InitLogging(config.log);

    // Step 4: dotenv, then credentials from the environment.
    auto env_loaded = cli.env_file ? LoadDotEnv(*cli.env_file, true)
                                   : LoadDotEnv(kDefaultEnvFile, false);
    if (env_loaded.IsErr()) {
        return PrintError(env_loaded.Error(), config.log.json);
    }

    LogInfo("main", std::string("trello-mcp ") + kVersion + " starting");
    LogInfo("main", config.api_key_env + ": " + Presence(EnvIsSet(config.api_key_env)));
    LogInfo("main", config.token_env + ": " + Presence(EnvIsSet(config.token_env)));

    if (cli.command != Command::Tools) {
        auto resolved = ResolveCredentials(std::move(config));
        if (resolved.IsErr()) {
            LogError("main", resolved.Error().message);
            return PrintError(resolved.Error(), config.log.json);
        }
        config = std::move(resolved).Value();

        auto valid = ValidateConfig(config);
        if (valid.IsErr()) {
            return PrintError(valid.Error(), config.log.json);
        }
    }

    // Step 5: Upstream client and tools.
    HttpSession session(kTrelloBaseUrl);
    TrelloClient client(session, config.credentials);
    ToolRegistry registry;
    RegisterTrelloTools(registry, client);

    // Step 6: Run.
    switch (cli.command) {
        case Command::Tools:
            return HandleTools(registry);
        case Command::Call:
            return HandleCall(registry, cli.call_tool, cli.call_args);
        case Command::Serve:
            break;
    }

    if (config.server.transport == Transport::Http) {
        return HandleHttp(config, registry);
    }

    McpServer server(registry);
    server.Run();
    return kExitSuccess;
}
