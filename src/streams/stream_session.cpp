#include "stream_session.hpp"

namespace manax {

std::unique_ptr<StreamResponse> open_event_stream(HttpClient& http,
                                                  const std::string& url,
                                                  const std::vector<Header>& headers,
                                                  CancelToken* cancel,
                                                  long timeout_seconds,
                                                  const std::string& op_name) {
    if (cancel && cancel->cancelled()) throw CancelledError();

    std::unique_ptr<StreamResponse> response;
    try {
        response = http.open_stream(url, headers, cancel, timeout_seconds);
    } catch (const TransportError& e) {
        if (cancel && cancel->cancelled()) throw CancelledError();
        throw TransportError(op_name + ": http request failed: " + e.what());
    }

    long status = response->status_code();
    if (status >= 200 && status < 300) return response;

    std::string body;
    try {
        body = response->read_all(ERROR_BODY_LIMIT);
    } catch (const TransportError& e) {
        if (cancel && cancel->cancelled()) throw CancelledError();
        // Classified from the status alone
        std::cerr << "[" << op_name << "] error body read failed: " << e.what() << "\n";
    }
    throw classify_error_response(status, body);
}

} // namespace manax
