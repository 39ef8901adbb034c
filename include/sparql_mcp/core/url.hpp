#pragma once

#include <sparql_mcp/core/result.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace sparql_mcp {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// Build an application/x-www-form-urlencoded body ("k1=v1&k2=v2").
std::string FormEncode(const std::map<std::string, std::string>& fields);

// ---------------------------------------------------------------------------
// HttpUrl: an absolute http(s) URL split into the parts an HTTP client
// needs: "scheme://host:port" for the connection and the request path.
// ---------------------------------------------------------------------------
struct HttpUrl {
    std::string scheme;  // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string path;    // always starts with '/', includes any query string

    [[nodiscard]] std::string Origin() const;
};

Result<HttpUrl, Error> ParseHttpUrl(std::string_view url);

} // namespace sparql_mcp
