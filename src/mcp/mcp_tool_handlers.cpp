#include <sparql_mcp/mcp/mcp_tool_handlers.hpp>

#include <sparql_mcp/core/log.hpp>
#include <sparql_mcp/sparql/sparql_format.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace sparql_mcp {

namespace {

using ToolOutcome = Result<ToolResult, RpcError>;

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

ToolOutcome InvalidParams(const std::string& message) {
    return ToolOutcome::Err(RpcError{rpc_code::kInvalidParams, message});
}

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

// Required string argument that is non-empty after trimming. The untrimmed
// value is returned.
std::optional<std::string> RequireNonBlankString(const nlohmann::json& args,
                                                 const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (IsBlank(value)) {
        return std::nullopt;
    }
    return value;
}

nlohmann::json StatusOrNull(const SparqlResponse& response) {
    return response.ok ? nlohmann::json(response.status) : nlohmann::json(nullptr);
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// echo: a missing text argument echoes the empty string.
ToolOutcome HandleEcho(const nlohmann::json& args) {
    std::string text;
    auto it = args.find("text");
    if (it != args.end() && !it->is_null()) {
        text = it->is_string() ? it->get<std::string>() : it->dump();
    }
    return ToolOutcome::Ok(ToolResult::Text("echo", "Echo: " + text));
}

ToolOutcome HandleSparqlQuery(ISparqlClient& client, const std::string& endpoint,
                              const nlohmann::json& args) {
    auto query = RequireNonBlankString(args, "query");
    if (!query) {
        return InvalidParams("Missing or empty \"query\" argument for sparqlQuery.");
    }

    bool json_preferred = true;
    auto it = args.find("jsonPreferred");
    if (it != args.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            return InvalidParams("\"jsonPreferred\" must be a boolean.");
        }
        json_preferred = it->get<bool>();
    }

    auto response = client.Query(endpoint, *query, json_preferred);

    auto result = ToolResult::Text("sparqlQuery", FormatSparqlResultAsText(response));
    result.meta = nlohmann::json{
        {"endpoint", endpoint},
        {"status", StatusOrNull(response)}
    };
    return ToolOutcome::Ok(std::move(result));
}

ToolOutcome HandleAuthorsByDoi(ISparqlClient& client, const std::string& endpoint,
                               const nlohmann::json& args) {
    auto doi = RequireNonBlankString(args, "doi");
    if (!doi) {
        return InvalidParams("Missing or empty \"doi\" argument for authorsByDoi.");
    }

    auto response = client.Query(endpoint, BuildAuthorsByDoiQuery(*doi), true);

    auto result = ToolResult::Text("authorsByDoi", FormatAuthorsResultAsText(response));
    result.meta = nlohmann::json{
        {"endpoint", endpoint},
        {"status", StatusOrNull(response)},
        {"doi", *doi}
    };
    return ToolOutcome::Ok(std::move(result));
}

} // anonymous namespace

void RegisterEchoTool(ToolRegistry& registry) {
    registry.Register(
        "echo",
        "Echo back the provided text.",
        MakeSchema({{"text", StringProp("Text to echo back")}},
                   nlohmann::json::array({"text"})),
        HandleEcho);
}

void RegisterSparqlTools(ToolRegistry& registry, ISparqlClient& client,
                         const std::string& endpoint) {
    LogDebug("tools", "Registering SPARQL tools for " + endpoint);

    registry.Register(
        "sparqlQuery",
        "Run an arbitrary SPARQL query against the configured endpoint.",
        MakeSchema({{"query", StringProp("SPARQL query string.")},
                    {"jsonPreferred", BoolProp(
                        "If true, request SPARQL JSON results (default true).")}},
                   nlohmann::json::array({"query"})),
        [&client, endpoint](const nlohmann::json& args) {
            return HandleSparqlQuery(client, endpoint, args);
        });

    registry.Register(
        "authorsByDoi",
        "Given a DOI, find all authors of the corresponding schema.org "
        "ScholarlyArticle.",
        MakeSchema({{"doi", StringProp(
                        "DOI of the paper, e.g. \"10.1234/foo.bar\".")}},
                   nlohmann::json::array({"doi"})),
        [&client, endpoint](const nlohmann::json& args) {
            return HandleAuthorsByDoi(client, endpoint, args);
        });
}

} // namespace sparql_mcp
