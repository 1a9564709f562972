#pragma once

#include <trello_mcp/config/app_config.hpp>
#include <trello_mcp/core/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace trello_mcp {

constexpr const char* kDefaultEnvFile = ".env";

// Load KEY=VALUE lines from a dotenv file into the process environment.
// Variables already set are kept. Blank lines and '#' comments are skipped;
// an "export " prefix and surrounding quotes are stripped.
// A missing file is an error only when required is true.
// Returns the number of variables set.
Result<std::size_t, Error> LoadDotEnv(std::string_view file_path, bool required);

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Merge CLI options over a base config: set CLI fields win.
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliOptions& cli_overrides);

// Read the credentials from the environment variables named in the config.
// Both must be present and non-empty.
Result<AppConfig, Error> ResolveCredentials(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace trello_mcp
