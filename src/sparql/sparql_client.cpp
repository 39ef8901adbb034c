#include <sparql_mcp/sparql/sparql_client.hpp>

#include <sparql_mcp/core/log.hpp>
#include <sparql_mcp/core/url.hpp>

#include <httplib.h>

namespace sparql_mcp {

namespace {

constexpr const char* kComponent = "sparql";

// A read that stalls past read_timeout surfaces as Error::Read.
bool IsTimeout(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return true;
        default:
            return false;
    }
}

SparqlResponse MakeFailure(int status, const std::string& error) {
    SparqlResponse response;
    response.ok = false;
    response.status = status;
    response.error = error;
    return response;
}

} // anonymous namespace

HttpSparqlClient::HttpSparqlClient(const SparqlClientOptions& options)
    : options_(options) {}

SparqlResponse HttpSparqlClient::Query(const std::string& endpoint,
                                       const std::string& query,
                                       bool accept_json) {
    LogInfo(kComponent, "Running SPARQL query against " + endpoint);

    auto url = ParseHttpUrl(endpoint);
    if (url.IsErr()) {
        LogError(kComponent, url.Error().ToString());
        return MakeFailure(0, "Invalid endpoint URL: " + url.Error().message);
    }

    httplib::Client client(url.Value().Origin());
    client.set_connection_timeout(options_.connect_timeout);
    client.set_read_timeout(options_.read_timeout);
    client.set_write_timeout(options_.read_timeout);
    client.set_follow_location(true);

    httplib::Headers headers = {
        {"Accept", accept_json ? kAcceptSparqlJson : kAcceptRdf},
    };
    auto body = FormEncode({{"query", query}});

    auto res = client.Post(url.Value().path, headers, body, kFormContentType);
    if (!res) {
        auto error = res.error();
        auto message = IsTimeout(error)
                           ? std::string("Request timed out")
                           : "HTTP client error: " + httplib::to_string(error);
        LogError(kComponent, message);
        return MakeFailure(0, message);
    }

    LogDebug(kComponent, "HTTP " + std::to_string(res->status) + ", " +
                             std::to_string(res->body.size()) + " bytes");

    SparqlResponse response;
    response.status = res->status;
    response.body = res->body;
    response.ok = res->status >= 200 && res->status < 300;
    if (!response.ok) {
        response.error = "HTTP status " + std::to_string(res->status);
        LogWarn(kComponent, *response.error + " from " + endpoint);
    }
    return response;
}

} // namespace sparql_mcp
