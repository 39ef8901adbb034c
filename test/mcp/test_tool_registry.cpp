#include <catch2/catch_test_macros.hpp>

#include <sparql_mcp/mcp/tool_registry.hpp>

#include <stdexcept>

using namespace sparql_mcp;

namespace {

ToolHandler ConstantText(const std::string& tool, const std::string& text) {
    return [tool, text](const nlohmann::json&) {
        return Result<ToolResult, RpcError>::Ok(ToolResult::Text(tool, text));
    };
}

} // anonymous namespace

TEST_CASE("ToolRegistry: register and list tools", "[mcp][registry]") {
    ToolRegistry registry;

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", {
            {"query", {{"type", "string"}}}
        }},
        {"required", nlohmann::json::array({"query"})}
    };

    registry.Register("sparqlQuery", "Run a SPARQL query", schema,
                      ConstantText("sparqlQuery", "ok"));

    REQUIRE(registry.Tools().size() == 1);
    CHECK(registry.Tools()[0].name == "sparqlQuery");
    CHECK(registry.Tools()[0].description == "Run a SPARQL query");
    CHECK(registry.Tools()[0].input_schema["required"][0] == "query");
}

TEST_CASE("ToolRegistry: execute registered tool", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "Echo input", nlohmann::json::object(),
        [](const nlohmann::json& args) {
            return Result<ToolResult, RpcError>::Ok(
                ToolResult::Text("echo", args.value("text", "")));
        });

    auto result = registry.Execute("echo", {{"text", "hello"}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().tool_name == "echo");
    REQUIRE(result.Value().content.size() == 1);
    CHECK(result.Value().content[0]["type"] == "text");
    CHECK(result.Value().content[0]["text"] == "hello");
}

TEST_CASE("ToolRegistry: execute unknown tool is method-not-found", "[mcp][registry]") {
    ToolRegistry registry;

    auto result = registry.Execute("nonexistent", nlohmann::json::object());
    REQUIRE(result.IsErr());
    CHECK(result.Error().code == rpc_code::kMethodNotFound);
    CHECK(result.Error().message.find("nonexistent") != std::string::npos);
}

TEST_CASE("ToolRegistry: handler errors pass through", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("strict", "Rejects everything", nlohmann::json::object(),
        [](const nlohmann::json&) {
            return Result<ToolResult, RpcError>::Err(
                RpcError{rpc_code::kInvalidParams, "nope"});
        });

    auto result = registry.Execute("strict", nlohmann::json::object());
    REQUIRE(result.IsErr());
    CHECK(result.Error().code == rpc_code::kInvalidParams);
}

TEST_CASE("ToolRegistry: handler exception becomes internal error", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("throw", "Throws", nlohmann::json::object(),
        [](const nlohmann::json&) -> Result<ToolResult, RpcError> {
            throw std::runtime_error("boom");
        });

    auto result = registry.Execute("throw", nlohmann::json::object());
    REQUIRE(result.IsErr());
    CHECK(result.Error().code == rpc_code::kInternalError);
    CHECK(result.Error().message.find("boom") != std::string::npos);
}

TEST_CASE("ToolRegistry: HasTool", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("foo", "Foo tool", nlohmann::json::object(),
                      ConstantText("foo", ""));

    CHECK(registry.HasTool("foo"));
    CHECK_FALSE(registry.HasTool("bar"));
}

TEST_CASE("ToolRegistry: tools listed in registration order", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("b", "Tool B", nlohmann::json::object(), ConstantText("b", "B"));
    registry.Register("a", "Tool A", nlohmann::json::object(), ConstantText("a", "A"));

    REQUIRE(registry.Tools().size() == 2);
    CHECK(registry.Tools()[0].name == "b");
    CHECK(registry.Tools()[1].name == "a");
}

TEST_CASE("ToolRegistry: re-registering a name replaces it", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("t", "First", nlohmann::json::object(), ConstantText("t", "1"));
    registry.Register("t", "Second", nlohmann::json::object(), ConstantText("t", "2"));

    REQUIRE(registry.Tools().size() == 1);
    CHECK(registry.Tools()[0].description == "Second");
    auto result = registry.Execute("t", nlohmann::json::object());
    REQUIRE(result.IsOk());
    CHECK(result.Value().content[0]["text"] == "2");
}

TEST_CASE("ToolResult: ToJson includes meta only when set", "[mcp][registry]") {
    auto plain = ToolResult::Text("echo", "hi").ToJson();
    CHECK(plain["toolName"] == "echo");
    CHECK(plain["content"][0]["text"] == "hi");
    CHECK_FALSE(plain.contains("meta"));

    auto with_meta = ToolResult::Text("sparqlQuery", "x");
    with_meta.meta = nlohmann::json{{"status", nullptr}};
    auto j = with_meta.ToJson();
    REQUIRE(j.contains("meta"));
    CHECK(j["meta"]["status"].is_null());
}
