#pragma once

#include <sparql_mcp/sparql/i_sparql_client.hpp>

#include <chrono>

namespace sparql_mcp {

constexpr const char* kAcceptSparqlJson =
    "application/sparql-results+json, application/json;q=0.9, */*;q=0.1";
constexpr const char* kAcceptRdf =
    "text/turtle, application/n-triples;q=0.9, application/rdf+xml;q=0.8, */*;q=0.1";
constexpr const char* kFormContentType =
    "application/x-www-form-urlencoded; charset=UTF-8";

struct SparqlClientOptions {
    std::chrono::seconds connect_timeout{20};
    std::chrono::seconds read_timeout{20};
};

// ---------------------------------------------------------------------------
// HttpSparqlClient: ISparqlClient over cpp-httplib.
//
// Sends the query as a form-encoded POST ("query=...") to the endpoint with
// an Accept header chosen by accept_json. A fresh connection is made per
// call; the server handles one request at a time.
// ---------------------------------------------------------------------------
class HttpSparqlClient : public ISparqlClient {
public:
    explicit HttpSparqlClient(const SparqlClientOptions& options = {});

    [[nodiscard]] SparqlResponse Query(const std::string& endpoint,
                                       const std::string& query,
                                       bool accept_json) override;

private:
    SparqlClientOptions options_;
};

} // namespace sparql_mcp
