#pragma once

#include <sparql_mcp/mcp/tool_registry.hpp>
#include <sparql_mcp/sparql/i_sparql_client.hpp>

#include <string>

namespace sparql_mcp {

// Register the "echo" tool.
void RegisterEchoTool(ToolRegistry& registry);

// Register "sparqlQuery" and "authorsByDoi" against endpoint.
// The handlers capture &client by reference; it must outlive the registry.
void RegisterSparqlTools(ToolRegistry& registry, ISparqlClient& client,
                         const std::string& endpoint);

} // namespace sparql_mcp
