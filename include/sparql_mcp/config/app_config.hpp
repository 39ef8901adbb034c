#pragma once

#include <sparql_mcp/core/log.hpp>

#include <optional>
#include <string>

namespace sparql_mcp {

constexpr const char* kFallbackEndpoint = "https://example.org/sparql";
constexpr const char* kEndpointEnvVar = "SPARQL_ENDPOINT";
constexpr int kDefaultTimeoutSeconds = 20;

struct SparqlConfig {
    std::string endpoint;                        // empty until resolved
    std::string endpoint_env = kEndpointEnvVar;  // env var consulted for endpoint
    int timeout_seconds = kDefaultTimeoutSeconds;
};

struct ServerConfig {
    std::string name = "sparql-mcp";
    std::string default_protocol_version = "2025-06-18";
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool json = false;
    std::optional<std::string> file;
    std::optional<bool> color;  // nullopt: color when stderr is a TTY
};

struct AppConfig {
    SparqlConfig sparql;
    ServerConfig server;
    LogConfig log;
};

// Flags given on the command line. Unset optionals leave lower layers alone.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> endpoint;
    std::optional<int> timeout_seconds;
    std::optional<std::string> log_file;
    bool log_json = false;
    int verbosity = 0;  // -v: info, -vv: debug
    std::optional<bool> color;
};

} // namespace sparql_mcp
