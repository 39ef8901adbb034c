#include <sparql_mcp/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace sparql_mcp {

namespace {

Error MakeUrlError(std::string_view url, const std::string& message) {
    return Error{"ParseHttpUrl", message + ": '" + std::string(url) + "'",
                 std::nullopt, ErrorCategory::Config};
}

} // anonymous namespace

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string FormEncode(const std::map<std::string, std::string>& fields) {
    std::string body;
    for (const auto& [key, value] : fields) {
        if (!body.empty()) body += '&';
        body += UrlEncode(key);
        body += '=';
        body += UrlEncode(value);
    }
    return body;
}

std::string HttpUrl::Origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Result<HttpUrl, Error> ParseHttpUrl(std::string_view url) {
    HttpUrl parsed;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return Result<HttpUrl, Error>::Err(MakeUrlError(url, "Missing scheme"));
    }
    parsed.scheme = std::string(url.substr(0, scheme_end));
    for (auto& c : parsed.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return Result<HttpUrl, Error>::Err(
            MakeUrlError(url, "Unsupported scheme '" + parsed.scheme + "'"));
    }

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_start);
    if (path_start == std::string_view::npos) {
        parsed.path = "/";
    } else {
        parsed.path = std::string(rest.substr(path_start));
        if (parsed.path.front() == '?') {
            parsed.path.insert(parsed.path.begin(), '/');
        }
    }

    // Drop userinfo; credentials in the endpoint URL are not supported.
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos &&
        authority.find(']', colon) == std::string_view::npos) {
        auto port_str = authority.substr(colon + 1);
        if (port_str.empty()) {
            return Result<HttpUrl, Error>::Err(MakeUrlError(url, "Empty port"));
        }
        unsigned long port = 0;
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return Result<HttpUrl, Error>::Err(
                    MakeUrlError(url, "Invalid port"));
            }
            port = port * 10 + static_cast<unsigned long>(c - '0');
            if (port > 65535) {
                return Result<HttpUrl, Error>::Err(
                    MakeUrlError(url, "Port out of range"));
            }
        }
        if (port == 0) {
            return Result<HttpUrl, Error>::Err(MakeUrlError(url, "Invalid port"));
        }
        parsed.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    } else {
        parsed.port = parsed.scheme == "https" ? 443 : 80;
    }

    if (authority.empty()) {
        return Result<HttpUrl, Error>::Err(MakeUrlError(url, "Missing host"));
    }
    parsed.host = std::string(authority);

    return Result<HttpUrl, Error>::Ok(std::move(parsed));
}

} // namespace sparql_mcp
