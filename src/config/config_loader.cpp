#include <sparql_mcp/config/config_loader.hpp>

#include <sparql_mcp/core/url.hpp>
#include <sparql_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace sparql_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, std::nullopt, ErrorCategory::Config};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseLogLevel
// ---------------------------------------------------------------------------
Result<LogLevel, Error> ParseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "debug") return Result<LogLevel, Error>::Ok(LogLevel::Debug);
    if (lower == "info") return Result<LogLevel, Error>::Ok(LogLevel::Info);
    if (lower == "warn" || lower == "warning") {
        return Result<LogLevel, Error>::Ok(LogLevel::Warn);
    }
    if (lower == "error") return Result<LogLevel, Error>::Ok(LogLevel::Error);
    return Result<LogLevel, Error>::Err(
        MakeConfigError("Unknown log level: '" + std::string(name) + "'"));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;

    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- SPARQL --
        if (root["sparql"]) {
            const auto& sparql = root["sparql"];
            if (sparql["endpoint"]) {
                config.sparql.endpoint = sparql["endpoint"].as<std::string>();
            }
            if (sparql["endpoint_env"]) {
                config.sparql.endpoint_env = sparql["endpoint_env"].as<std::string>();
            }
            if (sparql["timeout"]) {
                config.sparql.timeout_seconds = sparql["timeout"].as<int>();
            }
        }

        // -- Server --
        if (root["server"]) {
            const auto& server = root["server"];
            if (server["name"]) {
                config.server.name = server["name"].as<std::string>();
            }
            if (server["protocol_version"]) {
                config.server.default_protocol_version =
                    server["protocol_version"].as<std::string>();
            }
        }

        // -- Logging --
        if (root["log"]) {
            const auto& log = root["log"];
            if (log["level"]) {
                auto level = ParseLogLevel(log["level"].as<std::string>());
                if (level.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(level).Error());
                }
                config.log.level = level.Value();
            }
            if (log["json"]) {
                config.log.json = log["json"].as<bool>();
            }
            if (log["file"]) {
                config.log.file = log["file"].as<std::string>();
            }
            if (log["color"]) {
                config.log.color = log["color"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file '" + std::string(file_path) +
                            "': " + e.what()));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ParseCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> ParseCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("sparql-mcp", kVersion);
    program.add_description(
        "MCP server over stdio exposing SPARQL query tools.\n"
        "Accepts Content-Length framed or line-delimited JSON-RPC and answers "
        "in the framing the client uses.");

    CliOptions cli;

    program.add_argument("-e", "--endpoint")
        .help("SPARQL endpoint URL (overrides $" + std::string(kEndpointEnvVar) + ")");
    program.add_argument("-t", "--timeout")
        .help("SPARQL HTTP timeout in seconds")
        .scan<'i', int>();
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Increase log verbosity (-v info, -vv debug)")
        .action([&cli](const auto&) { ++cli.verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }
    if (auto val = program.present("--endpoint")) {
        cli.endpoint = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        cli.timeout_seconds = *val;
    }
    if (auto val = program.present("--log-file")) {
        cli.log_file = *val;
    }
    cli.log_json = program.get<bool>("--log-json");
    if (program.get<bool>("--no-color")) {
        cli.color = false;
    } else if (program.get<bool>("--color")) {
        cli.color = true;
    }

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// Layering
// ---------------------------------------------------------------------------
AppConfig ApplyEnvironment(AppConfig config) {
    if (config.sparql.endpoint_env.empty()) {
        return config;
    }
    const char* env_val = std::getenv(config.sparql.endpoint_env.c_str());
    if (env_val != nullptr && env_val[0] != '\0') {
        config.sparql.endpoint = env_val;
    }
    return config;
}

AppConfig ApplyCliOverrides(AppConfig config, const CliOptions& cli) {
    if (cli.endpoint.has_value()) {
        config.sparql.endpoint = *cli.endpoint;
    }
    if (cli.timeout_seconds.has_value()) {
        config.sparql.timeout_seconds = *cli.timeout_seconds;
    }
    if (cli.log_file.has_value()) {
        config.log.file = cli.log_file;
    }
    if (cli.log_json) {
        config.log.json = true;
    }
    if (cli.verbosity >= 2) {
        config.log.level = LogLevel::Debug;
    } else if (cli.verbosity == 1) {
        config.log.level = LogLevel::Info;
    }
    if (cli.color.has_value()) {
        config.log.color = cli.color;
    }
    return config;
}

AppConfig ApplyFallbacks(AppConfig config) {
    if (config.sparql.endpoint.empty()) {
        config.sparql.endpoint = kFallbackEndpoint;
    }
    return config;
}

Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto url = ParseHttpUrl(config.sparql.endpoint);
    if (url.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid SPARQL endpoint: " + url.Error().message));
    }
    if (config.sparql.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.sparql.timeout_seconds)));
    }
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server name must not be empty"));
    }
    if (config.server.default_protocol_version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Default protocol version must not be empty"));
    }
    return Result<void, Error>::Ok();
}

Result<AppConfig, Error> BuildConfig(const CliOptions& cli) {
    auto base = cli.config_path.has_value()
                    ? LoadFromYaml(*cli.config_path)
                    : Result<AppConfig, Error>::Ok(AppConfig{});

    return std::move(base).AndThen([&cli](AppConfig config) {
        config = ApplyFallbacks(ApplyCliOverrides(ApplyEnvironment(std::move(config)), cli));
        auto valid = ValidateConfig(config);
        if (valid.IsErr()) {
            return Result<AppConfig, Error>::Err(valid.Error());
        }
        return Result<AppConfig, Error>::Ok(std::move(config));
    });
}

} // namespace sparql_mcp
