#include <sparql_mcp/transport/framed_transport.hpp>

#include <sparql_mcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>
#include <vector>

namespace sparql_mcp {

namespace {

constexpr const char* kComponent = "transport";

Error MakeFramingError(const std::string& message) {
    return Error{"ReadMessage", message, std::nullopt, ErrorCategory::Framing};
}

Error MakeEndOfStream(const std::string& message) {
    return Error{"ReadMessage", message, std::nullopt, ErrorCategory::EndOfStream};
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string Trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), IsSpace);
    auto end = std::find_if_not(s.rbegin(), s.rend(), IsSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// First non-whitespace character, or '\0' for a blank line.
char FirstSignificant(const std::string& line) {
    auto it = std::find_if_not(line.begin(), line.end(), IsSpace);
    return it == line.end() ? '\0' : *it;
}

// Strict decimal. Rejects signs, trailing junk and values that overflow
// std::size_t.
std::optional<std::size_t> ParseContentLength(const std::string& value) {
    if (value.empty()) return std::nullopt;
    constexpr auto kMax = std::numeric_limits<std::size_t>::max();
    std::size_t length = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        auto digit = static_cast<std::size_t>(c - '0');
        if (length > (kMax - digit) / 10) return std::nullopt;
        length = length * 10 + digit;
    }
    return length;
}

} // anonymous namespace

const char* FramingModeName(FramingMode mode) {
    switch (mode) {
        case FramingMode::LengthPrefixed: return "length-prefixed";
        case FramingMode::LineDelimited:  return "line-delimited";
    }
    return "unknown";
}

FramedTransport::FramedTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

bool FramedTransport::ReadLine(std::string& line) {
    if (!std::getline(in_, line)) {
        return false;
    }
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    return true;
}

void FramedTransport::SetMode(FramingMode mode) {
    if (detected_mode_ != mode) {
        LogInfo(kComponent, std::string("Framing mode: ") + FramingModeName(mode));
    }
    detected_mode_ = mode;
}

// ---------------------------------------------------------------------------
// ReadMessage
//
//   skip blank lines ──► first significant char
//                          '{' or '[' ──► LineDelimited: the line is the body
//                          otherwise  ──► LengthPrefixed: the line is the
//                                         first header; read headers, then
//                                         exactly Content-Length bytes
// ---------------------------------------------------------------------------
Result<std::string, Error> FramedTransport::ReadMessage() {
    std::string line;
    do {
        if (!ReadLine(line)) {
            return Result<std::string, Error>::Err(
                MakeEndOfStream("End of input stream"));
        }
    } while (FirstSignificant(line) == '\0');

    const char first = FirstSignificant(line);
    if (first == '{' || first == '[') {
        SetMode(FramingMode::LineDelimited);
        LogDebug(kComponent, "Received line: " + line);
        return Result<std::string, Error>::Ok(std::move(line));
    }

    SetMode(FramingMode::LengthPrefixed);
    return ReadLengthPrefixed(std::move(line));
}

Result<std::string, Error> FramedTransport::ReadLengthPrefixed(
    std::string first_header) {
    std::map<std::string, std::string> headers;
    std::string line = std::move(first_header);

    while (!Trim(line).empty()) {
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            headers[ToLower(Trim(line.substr(0, colon)))] =
                Trim(line.substr(colon + 1));
        } else {
            LogDebug(kComponent, "Ignoring header line without ':': " + line);
        }
        if (!ReadLine(line)) {
            return Result<std::string, Error>::Err(
                MakeEndOfStream("End of input stream inside header block"));
        }
    }

    auto it = headers.find("content-length");
    if (it == headers.end()) {
        return Result<std::string, Error>::Err(
            MakeFramingError("Missing Content-Length header"));
    }

    auto length = ParseContentLength(it->second);
    if (!length || *length == 0) {
        return Result<std::string, Error>::Err(
            MakeFramingError("Invalid Content-Length: '" + it->second + "'"));
    }
    if (*length > kMaxBodyBytes) {
        // Discard the body so the next read starts at the next frame.
        if (!SkipBody(*length)) {
            return Result<std::string, Error>::Err(MakeEndOfStream(
                "End of input stream inside oversized body"));
        }
        return Result<std::string, Error>::Err(
            MakeFramingError("Content-Length " + it->second +
                             " exceeds limit of " +
                             std::to_string(kMaxBodyBytes) + " bytes"));
    }

    return ReadBody(*length);
}

bool FramedTransport::SkipBody(std::size_t length) {
    constexpr std::size_t kChunk = 64 * 1024;
    std::size_t remaining = length;
    while (remaining > 0) {
        in_.ignore(static_cast<std::streamsize>(std::min(remaining, kChunk)));
        auto got = static_cast<std::size_t>(in_.gcount());
        if (got == 0) {
            return false;
        }
        remaining -= got;
    }
    LogDebug(kComponent, "Skipped oversized body (" + std::to_string(length) + " bytes)");
    return true;
}

Result<std::string, Error> FramedTransport::ReadBody(std::size_t length) {
    std::string body;
    body.reserve(length);
    std::vector<char> chunk(std::min<std::size_t>(length, 64 * 1024));

    std::size_t remaining = length;
    while (remaining > 0) {
        in_.read(chunk.data(),
                 static_cast<std::streamsize>(std::min(remaining, chunk.size())));
        auto got = static_cast<std::size_t>(in_.gcount());
        if (got == 0) {
            return Result<std::string, Error>::Err(MakeFramingError(
                "Truncated body: expected " + std::to_string(length) +
                " bytes, got " + std::to_string(length - remaining)));
        }
        body.append(chunk.data(), got);
        remaining -= got;
    }

    LogDebug(kComponent, "Received body (" + std::to_string(length) +
                             " bytes): " + body);
    return Result<std::string, Error>::Ok(std::move(body));
}

// ---------------------------------------------------------------------------
// WriteMessage
// ---------------------------------------------------------------------------
Result<void, Error> FramedTransport::WriteMessage(const std::string& body) {
    if (Mode() == FramingMode::LengthPrefixed) {
        out_ << "Content-Length: " << body.size() << "\r\n\r\n" << body;
    } else {
        out_ << body << '\n';
    }
    out_.flush();

    if (!out_) {
        return Result<void, Error>::Err(Error{
            "WriteMessage", "Output stream failed", std::nullopt,
            ErrorCategory::Connection});
    }

    LogDebug(kComponent, std::string("Sent (") + FramingModeName(Mode()) +
                             "): " + body);
    return Result<void, Error>::Ok();
}

} // namespace sparql_mcp
