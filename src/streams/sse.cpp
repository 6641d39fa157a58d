#include "sse.hpp"
#include "../util.hpp"

namespace manax {

// Consumed prefix is dropped once it grows past this many bytes.
static constexpr size_t COMPACT_THRESHOLD = 4096;

SSEReader::SSEReader(ByteReader source) : source_(std::move(source)) {}

bool SSEReader::read_line(std::string& line) {
    while (true) {
        size_t newline = buffer_.find('\n', pos_);
        if (newline != std::string::npos) {
            line.assign(buffer_, pos_, newline - pos_);
            pos_ = newline + 1;
            if (pos_ > COMPACT_THRESHOLD) {
                buffer_.erase(0, pos_);
                pos_ = 0;
            }
            // Remove trailing \r if present
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (eof_) return false;

        char chunk[4096];
        size_t n = source_(chunk, sizeof(chunk));
        if (n == 0) {
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, n);
    }
}

std::optional<SSEEvent> SSEReader::read_event() {
    SSEEvent event;
    bool has_lines = false;
    bool has_fields = false;
    bool has_data = false;

    std::string line;
    while (read_line(line)) {
        if (line.empty()) {
            // Blank line ends the frame, unless nothing was seen yet
            if (!has_lines) continue;
            return event;
        }
        has_lines = true;

        if (line[0] == ':') {
            // Comments after a field belong to a data frame and are dropped
            if (!has_fields && !has_data) event.comment = trim(line.substr(1));
            continue;
        }

        std::string field;
        std::string value;
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            field = line.substr(0, colon);
            size_t start = colon + 1;
            if (start < line.size() && line[start] == ' ') ++start;
            value = line.substr(start);
        } else {
            field = line;
        }

        if (field == "event") {
            event.event = value;
            has_fields = true;
        } else if (field == "data") {
            if (!event.data.empty()) event.data += '\n';
            event.data += value;
            has_data = true;
        } else if (field == "id") {
            event.id = value;
            has_fields = true;
        } else if (field == "retry") {
            event.retry = value;
            has_fields = true;
        }
        // Unknown fields are ignored
    }

    // End of stream: partial frames are never emitted
    return std::nullopt;
}

} // namespace manax
