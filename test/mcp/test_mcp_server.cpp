#include <catch2/catch_test_macros.hpp>

#include <sparql_mcp/mcp/mcp_server.hpp>
#include <sparql_mcp/mcp/mcp_tool_handlers.hpp>

#include "mocks/mock_sparql_client.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace sparql_mcp;
using sparql_mcp::testing::MockSparqlClient;

namespace {

constexpr const char* kEndpoint = "https://sparql.example.test/query";

ToolRegistry MakeTestRegistry(MockSparqlClient& client) {
    ToolRegistry registry;
    RegisterEchoTool(registry);
    RegisterSparqlTools(registry, client, kEndpoint);
    return registry;
}

ServerInfo TestInfo() {
    ServerInfo info;
    info.version = "test";
    return info;
}

std::string Framed(const nlohmann::json& message) {
    auto body = message.dump();
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

std::string Line(const nlohmann::json& message) {
    return message.dump() + "\n";
}

nlohmann::json Request(int id, const std::string& method,
                       const nlohmann::json& params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

// Split Content-Length framed output back into bodies.
std::vector<nlohmann::json> ParseFramedOutput(const std::string& output) {
    std::vector<nlohmann::json> messages;
    std::size_t pos = 0;
    const std::string prefix = "Content-Length: ";
    while (pos < output.size()) {
        REQUIRE(output.compare(pos, prefix.size(), prefix) == 0);
        auto header_end = output.find("\r\n\r\n", pos);
        REQUIRE(header_end != std::string::npos);
        auto length = std::stoul(output.substr(pos + prefix.size(),
                                               header_end - pos - prefix.size()));
        auto body_start = header_end + 4;
        messages.push_back(nlohmann::json::parse(output.substr(body_start, length)));
        pos = body_start + length;
    }
    return messages;
}

std::vector<nlohmann::json> ParseLineOutput(const std::string& output) {
    std::vector<nlohmann::json> messages;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        messages.push_back(nlohmann::json::parse(line));
    }
    return messages;
}

// Runs the server over the given input and returns what it wrote.
struct Session {
    explicit Session(const std::string& input) : in(input), transport(in, out) {}

    std::string Run(MockSparqlClient& client) {
        McpServer server(MakeTestRegistry(client), transport, TestInfo());
        server.Run();
        return out.str();
    }

    std::istringstream in;
    std::ostringstream out;
    FramedTransport transport;
};

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize echoes requested protocol version", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"protocolVersion", "2024-11-05"}}));
    REQUIRE(response.has_value());

    auto r = response->ToJson();
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "sparql-mcp");
    CHECK(r["result"]["serverInfo"]["version"] == "test");
    CHECK(r["result"]["capabilities"]["tools"]["list"] == true);
    CHECK(r["result"]["capabilities"]["tools"]["call"] == true);
    CHECK(r["result"]["capabilities"]["resources"]["list"] == true);
    CHECK(r["result"]["capabilities"]["resources"]["read"] == false);
    CHECK(r["result"]["capabilities"]["resources"]["subscribe"] == false);
}

TEST_CASE("McpServer: initialize without version uses the default", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(1, "initialize"));
    REQUIRE(response.has_value());
    CHECK(response->ToJson()["result"]["protocolVersion"] == kDefaultProtocolVersion);
}

TEST_CASE("McpServer: tools/list returns registered tools", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());

    auto tools = response->ToJson()["result"]["tools"];
    REQUIRE(tools.size() == 3);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[1]["name"] == "sparqlQuery");
    CHECK(tools[2]["name"] == "authorsByDoi");
    for (const auto& tool : tools) {
        CHECK(tool["inputSchema"]["type"] == "object");
        CHECK_FALSE(tool["description"].get<std::string>().empty());
    }
}

TEST_CASE("McpServer: tools/call echo", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(3, "tools/call",
        {{"name", "echo"}, {"arguments", {{"text", "hi"}}}}));
    REQUIRE(response.has_value());

    auto r = response->ToJson();
    CHECK(r["result"]["toolName"] == "echo");
    REQUIRE(r["result"]["content"].size() == 1);
    CHECK(r["result"]["content"][0]["type"] == "text");
    CHECK(r["result"]["content"][0]["text"] == "Echo: hi");
}

TEST_CASE("McpServer: tools/call accepts legacy toolName key", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(3, "tools/call",
        {{"toolName", "echo"}, {"arguments", {{"text", "old"}}}}));
    REQUIRE(response.has_value());
    CHECK(response->ToJson()["result"]["content"][0]["text"] == "Echo: old");
}

TEST_CASE("McpServer: tools/call unknown tool is -32601", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(4, "tools/call", {{"name", "nonexistent"}}));
    REQUIRE(response.has_value());

    auto r = response->ToJson();
    CHECK(r["id"] == 4);
    CHECK(r["error"]["code"] == -32601);
    CHECK(r["error"]["message"].get<std::string>().find("nonexistent") != std::string::npos);
    CHECK_FALSE(r.contains("result"));
}

TEST_CASE("McpServer: tools/call without a name is -32601", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(6, "tools/call"));
    REQUIRE(response.has_value());
    CHECK(response->ToJson()["error"]["code"] == -32601);
}

TEST_CASE("McpServer: tools/call non-object arguments is -32602", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(7, "tools/call",
        {{"name", "echo"}, {"arguments", nlohmann::json::array({1, 2})}}));
    REQUIRE(response.has_value());
    CHECK(response->ToJson()["error"]["code"] == -32602);
}

TEST_CASE("McpServer: sparqlQuery without query is -32602 and makes no call", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(8, "tools/call",
        {{"name", "sparqlQuery"}, {"arguments", {{"query", "   "}}}}));
    REQUIRE(response.has_value());
    CHECK(response->ToJson()["error"]["code"] == -32602);
    CHECK(client.CallCount() == 0);
}

TEST_CASE("McpServer: resources/list is empty", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(9, "resources/list"));
    REQUIRE(response.has_value());
    auto resources = response->ToJson()["result"]["resources"];
    CHECK(resources.is_array());
    CHECK(resources.empty());
}

TEST_CASE("McpServer: resources/read is not implemented", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(10, "resources/read", {{"uri", "x"}}));
    REQUIRE(response.has_value());
    CHECK(response->ToJson()["error"]["code"] == -32001);
}

TEST_CASE("McpServer: ping", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(11, "ping"));
    REQUIRE(response.has_value());
    CHECK(response->ToJson()["result"]["ok"] == true);
}

TEST_CASE("McpServer: unknown method returns error", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage(Request(5, "unknown/method"));
    REQUIRE(response.has_value());
    auto r = response->ToJson();
    CHECK(r["error"]["code"] == -32601);
    CHECK(r["error"]["message"] == "Method not found: unknown/method");
}

TEST_CASE("McpServer: notification returns no response", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage({
        {"jsonrpc", "2.0"},
        {"method", "notifications/initialized"}
    });
    CHECK_FALSE(response.has_value());
}

TEST_CASE("McpServer: notification for a known method is still not answered", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage({{"jsonrpc", "2.0"}, {"method", "ping"}});
    CHECK_FALSE(response.has_value());
}

TEST_CASE("McpServer: request without method is -32600", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    auto response = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 12}});
    REQUIRE(response.has_value());
    auto r = response->ToJson();
    CHECK(r["id"] == 12);
    CHECK(r["error"]["code"] == -32600);
}

TEST_CASE("McpServer: HandleBody drops invalid JSON", "[mcp][server]") {
    MockSparqlClient client;
    Session session("");
    McpServer server(MakeTestRegistry(client), session.transport, TestInfo());

    CHECK_FALSE(server.HandleBody("{broken").has_value());
}

// ===========================================================================
// Run (stdio loop)
// ===========================================================================

TEST_CASE("McpServer: Run answers length-prefixed requests with length prefixes", "[mcp][server]") {
    MockSparqlClient client;
    Session session(Framed(Request(1, "initialize")) + Framed(Request(2, "tools/list")));

    auto output = session.Run(client);

    auto responses = ParseFramedOutput(output);
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[0]["result"].contains("protocolVersion"));
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"]["tools"].size() == 3);
}

TEST_CASE("McpServer: Run answers line-delimited requests with lines", "[mcp][server]") {
    MockSparqlClient client;
    Session session(Line(Request(1, "ping")) + Line(Request(2, "tools/call",
        {{"name", "echo"}, {"arguments", {{"text", "hi"}}}})));

    auto output = session.Run(client);

    CHECK(output.find("Content-Length") == std::string::npos);
    auto responses = ParseLineOutput(output);
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["result"]["ok"] == true);
    CHECK(responses[1]["result"]["content"][0]["text"] == "Echo: hi");
}

TEST_CASE("McpServer: Run writes nothing for a notification", "[mcp][server]") {
    MockSparqlClient client;
    Session session(Line({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}));

    CHECK(session.Run(client).empty());
}

TEST_CASE("McpServer: notification between requests adds no output", "[mcp][server]") {
    MockSparqlClient client;
    Session session(Line(Request(1, "ping")) +
                    Line({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}) +
                    Line(Request(2, "ping")));

    auto responses = ParseLineOutput(session.Run(client));
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[1]["id"] == 2);
}

TEST_CASE("McpServer: Run survives malformed messages", "[mcp][server]") {
    MockSparqlClient client;
    std::string input;
    input += "{not json}\n";                        // dropped: bad JSON
    input += "Content-Length: abc\r\n\r\n";         // dropped: bad header
    input += "X-Nothing: here\r\n\r\n";             // dropped: no length
    input += Framed(Request(3, "ping"));            // answered

    Session session(input);
    auto responses = ParseFramedOutput(session.Run(client));
    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["id"] == 3);
    CHECK(responses[0]["result"]["ok"] == true);
}

TEST_CASE("McpServer: Run stops at a truncated final body without replying", "[mcp][server]") {
    MockSparqlClient client;
    Session session(Framed(Request(1, "ping")) + "Content-Length: 500\r\n\r\n{\"id\":2");

    auto responses = ParseFramedOutput(session.Run(client));
    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["id"] == 1);
}

TEST_CASE("McpServer: Run routes sparqlQuery through the client", "[mcp][server]") {
    MockSparqlClient client;
    client.Enqueue({true, 200, R"({"head":{"vars":["s"]}})", std::nullopt});
    Session session(Line(Request(1, "tools/call",
        {{"name", "sparqlQuery"},
         {"arguments", {{"query", "SELECT * WHERE { ?s ?p ?o } LIMIT 3"}}}})));

    auto responses = ParseLineOutput(session.Run(client));
    REQUIRE(responses.size() == 1);
    REQUIRE(client.CallCount() == 1);
    CHECK(client.Calls()[0].endpoint == kEndpoint);
    CHECK(responses[0]["result"]["toolName"] == "sparqlQuery");
    CHECK(responses[0]["result"]["meta"]["status"] == 200);
    CHECK(responses[0]["result"]["meta"]["endpoint"] == kEndpoint);
}
