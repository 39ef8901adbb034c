#pragma once

#include <sparql_mcp/config/app_config.hpp>
#include <sparql_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace sparql_mcp {

// Parse a YAML config file on top of the built-in defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse command-line flags. --help and --version print and exit.
Result<CliOptions, Error> ParseCli(int argc, const char* const* argv);

// Take the endpoint from the environment variable named by
// sparql.endpoint_env when it is set and non-empty.
AppConfig ApplyEnvironment(AppConfig config);

// Overlay flags that were given on the command line.
AppConfig ApplyCliOverrides(AppConfig config, const CliOptions& cli);

// Fill an empty endpoint with kFallbackEndpoint.
AppConfig ApplyFallbacks(AppConfig config);

// Check the endpoint URL and numeric limits.
Result<void, Error> ValidateConfig(const AppConfig& config);

// defaults -> YAML (if --config) -> environment -> CLI -> fallbacks,
// then validation.
Result<AppConfig, Error> BuildConfig(const CliOptions& cli);

// "debug", "info", "warn"/"warning", "error" (case-insensitive).
Result<LogLevel, Error> ParseLogLevel(std::string_view name);

} // namespace sparql_mcp
