#pragma once

#include <optional>
#include <string>

namespace sparql_mcp {

// ---------------------------------------------------------------------------
// SparqlResponse: outcome of one SPARQL HTTP call.
//
// ok is true only for a 2xx reply. status is the HTTP status, or 0 when no
// response arrived (connection failure, timeout). error describes why ok is
// false; body is kept for non-2xx replies too.
// ---------------------------------------------------------------------------
struct SparqlResponse {
    bool ok = false;
    int status = 0;
    std::string body;
    std::optional<std::string> error;
};

// ---------------------------------------------------------------------------
// ISparqlClient: abstract SPARQL protocol client.
//
// Implementations bound the call with a timeout and report network
// failures in the SparqlResponse instead of throwing.
// ---------------------------------------------------------------------------
class ISparqlClient {
public:
    virtual ~ISparqlClient() = default;

    ISparqlClient(const ISparqlClient&) = delete;
    ISparqlClient& operator=(const ISparqlClient&) = delete;
    ISparqlClient(ISparqlClient&&) = delete;
    ISparqlClient& operator=(ISparqlClient&&) = delete;

    // accept_json selects SPARQL JSON results over RDF serializations.
    [[nodiscard]] virtual SparqlResponse Query(const std::string& endpoint,
                                               const std::string& query,
                                               bool accept_json) = 0;

protected:
    ISparqlClient() = default;
};

} // namespace sparql_mcp
