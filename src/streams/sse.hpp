#pragma once
#include <string>
#include <functional>
#include <optional>

namespace manax {

struct SSEEvent {
    std::string event;   // event type (e.g. "facts", "matches"); empty = default
    std::string data;    // data lines joined with '\n'
    std::string id;      // last "id:" value, not interpreted
    std::string retry;   // last "retry:" value (milliseconds as text), not interpreted
    std::string comment; // only for comment-only frames (": ping")

    bool is_comment_only() const {
        return !comment.empty() && event.empty() && data.empty();
    }
};

// Pulls up to len bytes into buf. Returns the count, 0 at end of stream.
// Failures are reported by throwing.
using ByteReader = std::function<size_t(char* buf, size_t len)>;

// Incremental Server-Sent Events reader over a blocking byte source.
// One reader per stream; not safe for concurrent callers.
class SSEReader {
public:
    explicit SSEReader(ByteReader source);

    // Blocks until a complete frame is read. Returns nullopt at end of
    // stream; a frame cut off by end of stream is discarded. Exceptions from
    // the byte source propagate unchanged.
    std::optional<SSEEvent> read_event();

private:
    // false at end of stream (a trailing unterminated line is dropped)
    bool read_line(std::string& line);

    ByteReader source_;
    std::string buffer_;
    size_t pos_ = 0;
    bool eof_ = false;
};

} // namespace manax
