#pragma once

#include <sparql_mcp/sparql/i_sparql_client.hpp>

#include <string>
#include <vector>

namespace sparql_mcp {

// "SPARQL error (HTTP <status>): <error>", followed by the body if any.
std::string FormatSparqlFailure(const SparqlResponse& response);

// Pretty-print a JSON body (4-space indent); any other body is returned as is.
std::string FormatSparqlResultAsText(const SparqlResponse& response);

// SELECT query for the schema:name of every schema:author of the
// schema:ScholarlyArticle whose schema:identifier equals doi, ignoring case.
std::string BuildAuthorsByDoiQuery(const std::string& doi);

// Values of results.bindings[].authorName.value, in order.
std::vector<std::string> ExtractAuthorNames(const std::string& sparql_json);

// Bulleted "Authors:" list, or a not-found message.
std::string FormatAuthorsResultAsText(const SparqlResponse& response);

} // namespace sparql_mcp
