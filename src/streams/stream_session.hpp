#pragma once
#include "sse.hpp"
#include "../cancel.hpp"
#include "../errors.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace manax {

// Why a callback-driven stream returned normally.
enum class StreamEnd {
    ServerClosed,   // end of stream; reconnect with the last cursor if desired
    HandlerStopped, // handler returned false
};

// Issue the streaming GET and check the status. Returns the open response
// for a 2xx status; otherwise reads at most ERROR_BODY_LIMIT bytes of the
// body and throws the classified ApiError.
std::unique_ptr<StreamResponse> open_event_stream(HttpClient& http,
                                                  const std::string& url,
                                                  const std::vector<Header>& headers,
                                                  CancelToken* cancel,
                                                  long timeout_seconds,
                                                  const std::string& op_name);

// One open SSE connection decoding `event_name` frames into Chunk.
// The response body is owned by the session and closed when the session
// ends (end of stream, error, close()) or is destroyed.
template <typename Chunk>
class StreamSession {
public:
    using value_type = Chunk;

    StreamSession(std::unique_ptr<StreamResponse> response, std::string op_name,
                  std::string event_name, CancelToken* cancel)
        : response_(std::move(response)),
          reader_(make_byte_reader(response_.get())),
          op_name_(std::move(op_name)),
          event_name_(std::move(event_name)),
          cancel_(cancel) {}

    StreamSession(StreamSession&&) = default;
    StreamSession& operator=(StreamSession&&) = default;

    // Blocks until the next matching payload arrives. Returns nullopt once
    // the server has closed the stream. Any exception closes the session.
    std::optional<Chunk> next() {
        if (!response_) return std::nullopt;
        try {
            auto chunk = read_chunk();
            if (!chunk) close();
            return chunk;
        } catch (...) {
            close();
            throw;
        }
    }

    bool is_open() const { return response_ != nullptr; }

    void close() { response_.reset(); }

private:
    static ByteReader make_byte_reader(StreamResponse* response) {
        return [response](char* buf, size_t len) { return response->read_some(buf, len); };
    }

    std::optional<Chunk> read_chunk() {
        while (true) {
            std::optional<SSEEvent> ev;
            try {
                ev = reader_.read_event();
            } catch (const TransportError& e) {
                if (cancel_ && cancel_->cancelled()) throw CancelledError();
                throw TransportError(op_name_ + ": read SSE event: " + e.what());
            }
            if (!ev) return std::nullopt;

            // Keepalives (": idle", ": ping", stream start/end markers)
            if (ev->is_comment_only()) continue;

            if (!ev->event.empty() && ev->event != event_name_) {
                std::cerr << "[" << event_name_ << "] ignoring event \"" << ev->event
                          << "\"\n";
                continue;
            }

            if (ev->data.empty()) {
                throw ProtocolError(op_name_ + ": received event \"" + event_name_ +
                                    "\" with empty data payload");
            }

            try {
                return nlohmann::json::parse(ev->data).template get<Chunk>();
            } catch (const nlohmann::json::exception& e) {
                throw ProtocolError(op_name_ + ": decode JSON payload: " + e.what());
            } catch (const std::invalid_argument& e) {
                throw ProtocolError(op_name_ + ": decode JSON payload: " + e.what());
            }
        }
    }

    std::unique_ptr<StreamResponse> response_;
    SSEReader reader_;
    std::string op_name_;
    std::string event_name_;
    CancelToken* cancel_;
};

// Pump a session into handler until the server closes the stream or the
// handler returns false. Handler exceptions propagate unchanged.
template <typename Chunk>
StreamEnd run_stream_session(
    StreamSession<Chunk>& session,
    const std::function<bool(const typename StreamSession<Chunk>::value_type&)>& handler) {
    while (auto chunk = session.next()) {
        if (!handler(*chunk)) {
            session.close();
            return StreamEnd::HandlerStopped;
        }
    }
    return StreamEnd::ServerClosed;
}

} // namespace manax
