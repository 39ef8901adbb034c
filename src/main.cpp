#include <sparql_mcp/config/config_loader.hpp>
#include <sparql_mcp/core/log.hpp>
#include <sparql_mcp/core/terminal.hpp>
#include <sparql_mcp/core/version.hpp>
#include <sparql_mcp/mcp/mcp_server.hpp>
#include <sparql_mcp/mcp/mcp_tool_handlers.hpp>
#include <sparql_mcp/sparql/sparql_client.hpp>
#include <sparql_mcp/transport/framed_transport.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

// Logs never go to stdout: it carries protocol frames.
std::unique_ptr<sparql_mcp::ILogSink> MakeLogSink(const sparql_mcp::LogConfig& log) {
    using namespace sparql_mcp;

    if (log.file.has_value()) {
        auto sink = std::make_unique<FileSink>(*log.file, log.json);
        if (sink->IsOpen()) {
            return sink;
        }
        std::cerr << "Warning: cannot open log file '" << *log.file
                  << "', logging to stderr\n";
    }
    if (log.json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    bool use_color = !NoColorEnvSet() && log.color.value_or(IsStderrTty());
    return std::make_unique<ColorConsoleSink>(use_color);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace sparql_mcp;

    auto cli = ParseCli(argc, argv);
    if (cli.IsErr()) {
        std::cerr << "Error: " << cli.Error().ToString() << "\n";
        return cli.Error().ExitCode();
    }

    auto config_result = BuildConfig(cli.Value());
    if (config_result.IsErr()) {
        std::cerr << "Error: " << config_result.Error().ToString() << "\n";
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    InitGlobalLogger(MakeLogSink(config.log), config.log.level);
    LogInfo("main", std::string("Starting ") + config.server.name + " " + kVersion);
    LogInfo("main", "SPARQL endpoint: " + config.sparql.endpoint);

    SparqlClientOptions client_options;
    client_options.connect_timeout = std::chrono::seconds(config.sparql.timeout_seconds);
    client_options.read_timeout = std::chrono::seconds(config.sparql.timeout_seconds);
    HttpSparqlClient client(client_options);

    ToolRegistry registry;
    RegisterEchoTool(registry);
    RegisterSparqlTools(registry, client, config.sparql.endpoint);

    ServerInfo info;
    info.name = config.server.name;
    info.version = kVersion;
    info.default_protocol_version = config.server.default_protocol_version;

    // Blocks until EOF on stdin.
    FramedTransport transport(std::cin, std::cout);
    McpServer server(std::move(registry), transport, std::move(info));
    server.Run();

    LogInfo("main", "Server shut down");
    return kExitSuccess;
}
