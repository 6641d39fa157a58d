#pragma once
#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <cstddef>

namespace manax {

class CancelToken;

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Case-insensitive header lookup; empty if absent.
std::string find_header(const std::vector<Header>& headers, const std::string& name);

// Replace (case-insensitive) or append a header.
void set_header(std::vector<Header>& headers, const std::string& name,
                const std::string& value);

// Response whose body is pulled incrementally. The connection is owned by
// this object and released when it is destroyed.
class StreamResponse {
public:
    virtual ~StreamResponse() = default;

    virtual long status_code() const = 0;

    // Reads up to len body bytes. Returns the number read, 0 at end of body.
    // Throws TransportError on failure (including cancellation).
    virtual size_t read_some(char* buf, size_t len) = 0;

    // Drain at most limit bytes of the body.
    std::string read_all(size_t limit);
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Buffered request. Throws TransportError when no response was received.
    virtual HttpResponse request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds = 30) = 0;

    // GET whose body is read by the caller. Returns once the status line and
    // headers have arrived. cancel may be null; when it fires, a blocked
    // read_some() returns with TransportError.
    virtual std::unique_ptr<StreamResponse> open_stream(const std::string& url,
                                                        const std::vector<Header>& headers,
                                                        CancelToken* cancel,
                                                        long timeout_seconds = 30) = 0;

    HttpResponse get(const std::string& url, const std::vector<Header>& headers,
                     long timeout_seconds = 30) {
        return request("GET", url, "", headers, timeout_seconds);
    }
};

// Linux: POSIX sockets + OpenSSL (HTTP/1.1, http and https)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 30) override;

    std::unique_ptr<StreamResponse> open_stream(const std::string& url,
                                                const std::vector<Header>& headers,
                                                CancelToken* cancel,
                                                long timeout_seconds = 30) override;
};
using PlatformHttpClient = SocketHttpClient;

} // namespace manax
