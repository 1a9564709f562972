#include <catch2/catch_test_macros.hpp>

#include <trello_mcp/config/config_loader.hpp>

#include <cstdlib>
#include <string>

using namespace trello_mcp;

namespace {

void SetEnv(const char* name, const char* value) {
    setenv(name, value, 1);
}

void UnsetEnv(const char* name) {
    unsetenv(name);
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

// Tests are run from the build directory; derive the testdata path from
// this source file instead.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config/full_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.transport == Transport::Http);
    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 8080);
    CHECK(config.log.level == LogLevel::Debug);
    CHECK(config.log.json);
    REQUIRE(config.log.color.has_value());
    CHECK_FALSE(*config.log.color);
    CHECK(config.api_key_env == "MY_TRELLO_KEY");
    CHECK(config.token_env == "MY_TRELLO_TOKEN");
    CHECK(config.credentials.api_key.empty());
    CHECK(config.credentials.token.empty());
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config/minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.log.level == LogLevel::Info);
    CHECK(config.server.transport == Transport::Stdio);
    CHECK(config.server.host == "127.0.0.1");
    CHECK(config.server.port == 3000);
    CHECK_FALSE(config.log.json);
    CHECK_FALSE(config.log.color.has_value());
    CHECK(config.api_key_env == "TRELLO_API_KEY");
    CHECK(config.token_env == "TRELLO_TOKEN");
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: invalid transport", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config/invalid_transport.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("websocket") != std::string::npos);
}

TEST_CASE("LoadFromYaml: port out of range", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config/invalid_port.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid port: 70000");
}

TEST_CASE("LoadFromYaml: credentials in file are rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config/credentials_in_file.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
    CHECK(result.Error().message.find("environment") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config/malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: root must be a mapping", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("config/not_a_mapping.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Config file must contain a YAML mapping");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no args serves over stdio", "[config][cli]") {
    const char* argv[] = {"trello-mcp"};
    auto result = LoadFromCli(1, argv);
    REQUIRE(result.IsOk());
    const auto& opts = result.Value();

    CHECK(opts.command == Command::Serve);
    CHECK_FALSE(opts.transport.has_value());
    CHECK_FALSE(opts.config_file.has_value());
    CHECK_FALSE(opts.log_level.has_value());
    CHECK_FALSE(opts.no_color);
    CHECK_FALSE(opts.show_version);
}

TEST_CASE("LoadFromCli: mcp subcommand selects stdio", "[config][cli]") {
    const char* argv[] = {"trello-mcp", "mcp"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().transport.has_value());
    CHECK(*result.Value().transport == Transport::Stdio);
}

TEST_CASE("LoadFromCli: serve with host and port", "[config][cli]") {
    const char* argv[] = {"trello-mcp", "serve", "--host", "0.0.0.0", "--port", "8081"};
    auto result = LoadFromCli(6, argv);
    REQUIRE(result.IsOk());
    const auto& opts = result.Value();

    CHECK(opts.command == Command::Serve);
    REQUIRE(opts.transport.has_value());
    CHECK(*opts.transport == Transport::Http);
    CHECK(*opts.host == "0.0.0.0");
    CHECK(*opts.port == 8081);
}

TEST_CASE("LoadFromCli: serve rejects port zero", "[config][cli]") {
    const char* argv[] = {"trello-mcp", "serve", "--port", "0"};
    auto result = LoadFromCli(4, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid port: 0");
}

TEST_CASE("LoadFromCli: global flags", "[config][cli]") {
    const char* argv[] = {"trello-mcp", "-c", "cfg.yaml", "--env-file", "prod.env",
                          "-vv", "--log-format", "json", "--no-color", "mcp"};
    auto result = LoadFromCli(10, argv);
    REQUIRE(result.IsOk());
    const auto& opts = result.Value();

    CHECK(*opts.config_file == "cfg.yaml");
    CHECK(*opts.env_file == "prod.env");
    CHECK(*opts.log_level == LogLevel::Debug);
    CHECK(*opts.log_json);
    CHECK(opts.no_color);
}

TEST_CASE("LoadFromCli: -v selects info logging", "[config][cli]") {
    const char* argv[] = {"trello-mcp", "-v"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsOk());
    CHECK(*result.Value().log_level == LogLevel::Info);
}

TEST_CASE("LoadFromCli: invalid log format", "[config][cli]") {
    const char* argv[] = {"trello-mcp", "--log-format", "xml"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadFromCli: version flag", "[config][cli]") {
    const char* argv[] = {"trello-mcp", "--version"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().show_version);
}

TEST_CASE("LoadFromCli: tools subcommand", "[config][cli]") {
    const char* argv[] = {"trello-mcp", "tools"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().command == Command::Tools);
}

TEST_CASE("LoadFromCli: call subcommand with and without args", "[config][cli]") {
    SECTION("with args") {
        const char* argv[] = {"trello-mcp", "call", "get_lists", R"({"boardId":"b1"})"};
        auto result = LoadFromCli(4, argv);
        REQUIRE(result.IsOk());
        CHECK(result.Value().command == Command::Call);
        CHECK(result.Value().call_tool == "get_lists");
        CHECK(result.Value().call_args == R"({"boardId":"b1"})");
    }
    SECTION("without args") {
        const char* argv[] = {"trello-mcp", "call", "list_boards"};
        auto result = LoadFromCli(3, argv);
        REQUIRE(result.IsOk());
        CHECK(result.Value().call_tool == "list_boards");
        CHECK(result.Value().call_args == "{}");
    }
}

TEST_CASE("LoadFromCli: unknown option", "[config][cli]") {
    const char* argv[] = {"trello-mcp", "--bogus"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML values", "[config][merge]") {
    AppConfig yaml;
    yaml.server.host = "0.0.0.0";
    yaml.server.port = 8080;
    yaml.log.level = LogLevel::Error;
    yaml.log.color = true;

    CliOptions cli;
    cli.transport = Transport::Http;
    cli.port = 9090;
    cli.log_level = LogLevel::Debug;
    cli.log_json = true;
    cli.no_color = true;

    auto merged = MergeConfigs(yaml, cli);
    CHECK(merged.server.transport == Transport::Http);
    CHECK(merged.server.host == "0.0.0.0");
    CHECK(merged.server.port == 9090);
    CHECK(merged.log.level == LogLevel::Debug);
    CHECK(merged.log.json);
    REQUIRE(merged.log.color.has_value());
    CHECK_FALSE(*merged.log.color);
}

TEST_CASE("MergeConfigs: YAML values preserved when CLI not set", "[config][merge]") {
    AppConfig yaml;
    yaml.server.transport = Transport::Http;
    yaml.api_key_env = "K";
    yaml.log.color = true;

    auto merged = MergeConfigs(yaml, CliOptions{});
    CHECK(merged.server.transport == Transport::Http);
    CHECK(merged.api_key_env == "K");
    CHECK(*merged.log.color);
}

// ===========================================================================
// LoadDotEnv
// ===========================================================================

TEST_CASE("LoadDotEnv: loads assignments and keeps existing variables", "[config][env]") {
    UnsetEnv("TRELLO_MCP_TEST_KEY");
    UnsetEnv("TRELLO_MCP_TEST_TOKEN");
    UnsetEnv("TRELLO_MCP_TEST_QUOTED");
    SetEnv("TRELLO_MCP_TEST_PRESET", "from-shell");

    auto result = LoadDotEnv(TestDataPath("env/sample.env"), true);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == 3);

    CHECK(GetEnv("TRELLO_MCP_TEST_KEY") == "key-from-file");
    CHECK(GetEnv("TRELLO_MCP_TEST_TOKEN") == "token from file");
    CHECK(GetEnv("TRELLO_MCP_TEST_QUOTED") == "single quoted");
    CHECK(GetEnv("TRELLO_MCP_TEST_PRESET") == "from-shell");

    UnsetEnv("TRELLO_MCP_TEST_KEY");
    UnsetEnv("TRELLO_MCP_TEST_TOKEN");
    UnsetEnv("TRELLO_MCP_TEST_QUOTED");
    UnsetEnv("TRELLO_MCP_TEST_PRESET");
}

TEST_CASE("LoadDotEnv: missing optional file is not an error", "[config][env]") {
    auto result = LoadDotEnv("/nonexistent/.env", false);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == 0);
}

TEST_CASE("LoadDotEnv: missing required file is an error", "[config][env]") {
    auto result = LoadDotEnv("/nonexistent/.env", true);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

// ===========================================================================
// ResolveCredentials
// ===========================================================================

TEST_CASE("ResolveCredentials: reads the configured variables", "[config][env]") {
    SetEnv("TRELLO_MCP_TEST_RESOLVE_KEY", "k1");
    SetEnv("TRELLO_MCP_TEST_RESOLVE_TOKEN", "t1");

    AppConfig config;
    config.api_key_env = "TRELLO_MCP_TEST_RESOLVE_KEY";
    config.token_env = "TRELLO_MCP_TEST_RESOLVE_TOKEN";

    auto result = ResolveCredentials(config);
    REQUIRE(result.IsOk());
    CHECK(result.Value().credentials.api_key == "k1");
    CHECK(result.Value().credentials.token == "t1");

    UnsetEnv("TRELLO_MCP_TEST_RESOLVE_KEY");
    UnsetEnv("TRELLO_MCP_TEST_RESOLVE_TOKEN");
}

TEST_CASE("ResolveCredentials: names every missing variable", "[config][env]") {
    UnsetEnv("TRELLO_MCP_TEST_ABSENT_KEY");
    SetEnv("TRELLO_MCP_TEST_EMPTY_TOKEN", "");

    AppConfig config;
    config.api_key_env = "TRELLO_MCP_TEST_ABSENT_KEY";
    config.token_env = "TRELLO_MCP_TEST_EMPTY_TOKEN";

    auto result = ResolveCredentials(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message ==
          "Missing Trello credentials: TRELLO_MCP_TEST_ABSENT_KEY, "
          "TRELLO_MCP_TEST_EMPTY_TOKEN must be set in the environment or a .env file");
    CHECK(result.Error().ExitCode() == 2);

    UnsetEnv("TRELLO_MCP_TEST_EMPTY_TOKEN");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

namespace {

AppConfig MakeValidConfig() {
    AppConfig config;
    config.credentials = TrelloCredentials{"k", "t"};
    return config;
}

} // anonymous namespace

TEST_CASE("ValidateConfig: valid config passes", "[config][validate]") {
    CHECK(ValidateConfig(MakeValidConfig()).IsOk());
}

TEST_CASE("ValidateConfig: missing token", "[config][validate]") {
    auto config = MakeValidConfig();
    config.credentials.token.clear();
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Missing required value: TRELLO_TOKEN");
}

TEST_CASE("ValidateConfig: http transport needs a host", "[config][validate]") {
    auto config = MakeValidConfig();
    config.server.transport = Transport::Http;
    config.server.host.clear();
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Missing required field: host");
}

TEST_CASE("ValidateConfig: stdio ignores listener settings", "[config][validate]") {
    auto config = MakeValidConfig();
    config.server.host.clear();
    config.server.port = 0;
    CHECK(ValidateConfig(config).IsOk());
}
