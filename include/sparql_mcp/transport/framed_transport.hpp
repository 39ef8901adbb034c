#pragma once

#include <sparql_mcp/core/result.hpp>

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

namespace sparql_mcp {

// ---------------------------------------------------------------------------
// FramingMode: how discrete messages are delimited on the byte stream.
//
//   LengthPrefixed:  "Content-Length: <n>\r\n\r\n<n bytes of JSON>"
//   LineDelimited:   "<one JSON document>\n"
// ---------------------------------------------------------------------------
enum class FramingMode {
    LengthPrefixed,
    LineDelimited,
};

const char* FramingModeName(FramingMode mode);

// Bodies larger than this are discarded unread and reported as a Framing
// error.
constexpr std::size_t kMaxBodyBytes = 16u * 1024u * 1024u;

// ---------------------------------------------------------------------------
// FramedTransport: reads and writes one message body per call over a pair
// of streams, auto-detecting the peer's framing from the first
// non-blank line of each inbound message and answering in the same mode.
//
// Read errors are categorized:
//   EndOfStream  the input is exhausted; the only condition that should stop
//                a read loop
//   Framing      malformed headers, bad Content-Length, oversized or
//                truncated body
//
// Writes use the mode detected by the most recent read, or LengthPrefixed
// if nothing has been read yet. Output is flushed after every message.
//
// One instance per connection; not thread-safe.
// ---------------------------------------------------------------------------
class FramedTransport {
public:
    FramedTransport(std::istream& in, std::ostream& out);

    FramedTransport(const FramedTransport&) = delete;
    FramedTransport& operator=(const FramedTransport&) = delete;

    // Read exactly one message body. The body is not validated as JSON.
    [[nodiscard]] Result<std::string, Error> ReadMessage();

    // Write one message body using the current framing mode.
    [[nodiscard]] Result<void, Error> WriteMessage(const std::string& body);

    // Mode used for the next write.
    [[nodiscard]] FramingMode Mode() const noexcept {
        return detected_mode_.value_or(FramingMode::LengthPrefixed);
    }

    // Mode seen on the most recent read; nullopt before the first read.
    [[nodiscard]] std::optional<FramingMode> DetectedMode() const noexcept {
        return detected_mode_;
    }

private:
    bool ReadLine(std::string& line);
    void SetMode(FramingMode mode);
    Result<std::string, Error> ReadLengthPrefixed(std::string first_header);
    Result<std::string, Error> ReadBody(std::size_t length);
    // False when the input ends before length bytes were discarded.
    bool SkipBody(std::size_t length);

    std::istream& in_;
    std::ostream& out_;
    std::optional<FramingMode> detected_mode_;
};

} // namespace sparql_mcp
