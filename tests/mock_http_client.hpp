#pragma once
#include "http.hpp"
#include "cancel.hpp"
#include "errors.hpp"
#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace manax {

// Scripted streaming response. Each piece is delivered by its own
// read_some() call (split further when the caller's buffer is smaller).
struct StreamScript {
    long status = 200;
    std::vector<std::string> pieces;
    std::string fail_message; // non-empty: read fails with this after the pieces
    bool block_at_end = false; // read blocks until the cancel token fires
};

class ScriptedStreamResponse : public StreamResponse {
public:
    ScriptedStreamResponse(StreamScript script, CancelToken* cancel, int* close_counter)
        : script_(std::move(script)), cancel_(cancel), close_counter_(close_counter) {
        if (cancel_) {
            registration_ = std::make_unique<CancelRegistration>(cancel_, [this] {
                std::lock_guard<std::mutex> lock(mu_);
                interrupted_ = true;
                cv_.notify_all();
            });
        }
    }

    ~ScriptedStreamResponse() override {
        registration_.reset();
        if (close_counter_) ++*close_counter_;
    }

    long status_code() const override { return script_.status; }

    size_t read_some(char* buf, size_t len) override {
        throw_if_cancelled();

        while (index_ < script_.pieces.size() && script_.pieces[index_].empty()) index_++;
        if (index_ < script_.pieces.size()) {
            const std::string& piece = script_.pieces[index_];
            size_t n = std::min(len, piece.size() - offset_);
            std::memcpy(buf, piece.data() + offset_, n);
            offset_ += n;
            if (offset_ == piece.size()) {
                index_++;
                offset_ = 0;
            }
            return n;
        }

        if (!script_.fail_message.empty()) throw TransportError(script_.fail_message);

        if (script_.block_at_end) {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return interrupted_; });
            throw TransportError("connection interrupted: operation cancelled");
        }
        return 0;
    }

private:
    void throw_if_cancelled() const {
        if (cancel_ && cancel_->cancelled())
            throw TransportError("connection interrupted: operation cancelled");
    }

    StreamScript script_;
    size_t index_ = 0;
    size_t offset_ = 0;
    CancelToken* cancel_;
    int* close_counter_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool interrupted_ = false;
    std::unique_ptr<CancelRegistration> registration_;
};

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    StreamScript next_stream;
    std::string connect_error; // non-empty: every call fails with TransportError

    std::string last_method;
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    long last_timeout = 0;
    int call_count = 0;
    int stream_count = 0;
    int streams_closed = 0;

    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds) override {
        call_count++;
        last_method = method;
        last_url = url;
        last_body = body;
        last_headers = headers;
        last_timeout = timeout_seconds;
        if (!connect_error.empty()) throw TransportError(connect_error);
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }

    std::unique_ptr<StreamResponse> open_stream(const std::string& url,
                                                const std::vector<Header>& headers,
                                                CancelToken* cancel,
                                                long timeout_seconds) override {
        stream_count++;
        last_method = "GET";
        last_url = url;
        last_body.clear();
        last_headers = headers;
        last_timeout = timeout_seconds;
        if (!connect_error.empty()) throw TransportError(connect_error);
        return std::make_unique<ScriptedStreamResponse>(next_stream, cancel, &streams_closed);
    }
};

// Query parameter value as sent (still percent-encoded); empty if absent.
inline std::string query_param(const std::string& url, const std::string& name) {
    size_t q = url.find('?');
    if (q == std::string::npos) return "";
    std::string query = url.substr(q + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        size_t eq = pair.find('=');
        if (pair.substr(0, eq) == name)
            return eq == std::string::npos ? "" : pair.substr(eq + 1);
        pos = amp + 1;
    }
    return "";
}

inline bool has_query_param(const std::string& url, const std::string& name) {
    size_t q = url.find('?');
    if (q == std::string::npos) return false;
    std::string query = "&" + url.substr(q + 1) + "&";
    return query.find("&" + name + "=") != std::string::npos;
}

} // namespace manax
