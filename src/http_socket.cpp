// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// HTTP/1.1 with "Connection: close"; bodies may be chunked, length-delimited
// or terminated by connection close.
#include "http.hpp"
#include "cancel.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <sys/socket.h>
#include <pthread.h>
#include <signal.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <string>

// MSG_NOSIGNAL prevents SIGPIPE for send() on Linux; where it is missing
// (macOS) the socket gets SO_NOSIGPIPE instead.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace manax {

// ── SIGPIPE suppression for OpenSSL I/O ───────────────────────

// OpenSSL's socket BIO writes with plain write(), so a peer reset would
// raise SIGPIPE. Blocks it on the calling thread for the guard's lifetime
// and discards one raised in the meantime.
class SigpipeGuard {
public:
#ifdef SO_NOSIGPIPE
    SigpipeGuard() = default;
#else
    SigpipeGuard() {
        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        sigset_t block;
        sigemptyset(&block);
        sigaddset(&block, SIGPIPE);
        active_ = pthread_sigmask(SIG_BLOCK, &block, &old_mask_) == 0;
    }

    ~SigpipeGuard() {
        if (!active_) return;
        int saved_errno = errno;
        if (!was_pending_) {
            sigset_t pending;
            sigemptyset(&pending);
            sigpending(&pending);
            if (sigismember(&pending, SIGPIPE) == 1) {
                sigset_t pipe_only;
                sigemptyset(&pipe_only);
                sigaddset(&pipe_only, SIGPIPE);
                struct timespec zero{0, 0};
                while (sigtimedwait(&pipe_only, nullptr, &zero) < 0 && errno == EINTR) {}
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
        errno = saved_errno;
    }

private:
    sigset_t old_mask_;
    bool was_pending_ = false;
    bool active_ = false;
#endif

public:
    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;
};

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host; // without brackets for IPv6 literals
    std::string port;
    bool ipv6_literal = false;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw TransportError("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "https") result.tls = true;
    else if (scheme != "http")
        throw TransportError("unsupported URL scheme: " + url);

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos) result.path = "/";
    else if (url[path_start] == '?') result.path = "/" + url.substr(path_start);
    else result.path = url.substr(path_start);

    std::string port_part;
    if (!host_port.empty() && host_port[0] == '[') {
        // [v6addr] or [v6addr]:port
        size_t close = host_port.find(']');
        if (close == std::string::npos)
            throw TransportError("invalid URL (unterminated IPv6 host): " + url);
        result.host = host_port.substr(1, close - 1);
        result.ipv6_literal = true;
        if (close + 1 < host_port.size()) {
            if (host_port[close + 1] != ':')
                throw TransportError("invalid URL (bad IPv6 host): " + url);
            port_part = host_port.substr(close + 2);
        }
    } else {
        size_t colon = host_port.find(':');
        result.host = host_port.substr(0, colon);
        if (colon != std::string::npos) port_part = host_port.substr(colon + 1);
    }
    result.port = port_part.empty() ? (result.tls ? "443" : "80") : port_part;
    if (result.host.empty())
        throw TransportError("invalid URL (no host): " + url);
    return result;
}

// Host as written in the authority (brackets restored for IPv6).
static std::string authority_host(const ParsedUrl& url) {
    return url.ipv6_literal ? "[" + url.host + "]" : url.host;
}

static std::string errno_text(int err) {
    return std::strerror(err);
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    bool interrupted = false;
    std::string error;

    Connection() = default;
    ~Connection() {
        if (ssl) {
            if (!interrupted) {
                SigpipeGuard guard;
                SSL_shutdown(ssl);
            }
            SSL_free(ssl);
        }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = "resolve " + url.host + ": " + gai_strerror(gai);
            return false;
        }

        bool connected = false;
        int last_err = 0;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_err = errno; continue; }

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    } else {
                        last_err = err;
                    }
                } else {
                    last_err = rc == 0 ? ETIMEDOUT : errno;
                }
            } else {
                last_err = errno;
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = "connect " + authority_host(url) + ":" + url.port + ": " + errno_text(last_err);
            return false;
        }

#ifdef SO_NOSIGPIPE
        int one = 1;
        setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
        set_socket_timeout(timeout_secs);

        if (url.tls) {
            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "TLS: cannot create context"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "TLS: cannot create session"; return false; }
            SSL_set_fd(ssl, fd);
            if (url.ipv6_literal) {
                // No SNI for address literals; verify against the IP SAN
                X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), url.host.c_str());
            } else {
                SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI
                SSL_set1_host(ssl, url.host.c_str());
            }

            int rc;
            {
                SigpipeGuard guard;
                rc = SSL_connect(ssl);
            }
            if (rc != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                error = std::string("TLS handshake with ") + url.host + ": " + buf;
                return false;
            }
        }
        return true;
    }

    // Unblocks a read in progress on another thread. The descriptor stays
    // open until the destructor runs.
    void interrupt() {
        interrupted = true;
        if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on unrecoverable
    // error (including receive timeout).
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            ssize_t n;
            if (ssl) {
                errno = 0;
                {
                    SigpipeGuard guard;
                    n = SSL_read(ssl, buf, static_cast<int>(len));
                }
                if (n > 0) return n;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL && n == 0 && errno == 0)
                    return 0; // peer closed without close_notify
                error = err == SSL_ERROR_SYSCALL ? errno_text(errno) : "TLS read failed";
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n >= 0) return n;
                if (errno == EINTR) continue;
                error = (errno == EAGAIN || errno == EWOULDBLOCK)
                    ? "read timed out" : errno_text(errno);
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                {
                    SigpipeGuard guard;
                    n = SSL_write(ssl, buf, static_cast<int>(len));
                }
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    error = "TLS write failed";
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    error = errno_text(errno);
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    // 0 disables the timeout (block until data, close or interrupt).
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    bool default_port = url.port == (url.tls ? "443" : "80");
    req += "Host: " + authority_host(url) + (default_port ? "" : ":" + url.port) + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (iequals(h.first, "Content-Length")) has_content_length = true;
    }
    if (!has_content_length && (!body.empty() || method == "POST" ||
                                method == "PUT" || method == "PATCH"))
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a line (CR stripped), using leftover as a look-ahead buffer.
// Returns 1 on success, 0 on EOF before a full line, -1 on read error.
static int read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return 1;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n < 0) return -1;
        if (n == 0) return 0;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct ResponseHead {
    long status = 0;
    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

// Parse status line + headers. Throws TransportError when the head is
// missing or malformed.
static ResponseHead parse_response_head(Connection& conn, std::string& leftover) {
    ResponseHead head;

    std::string status_line;
    int rc = read_line(conn, leftover, status_line);
    if (rc < 0) throw TransportError("read response: " + conn.error);
    if (rc == 0 || status_line.empty())
        throw TransportError("connection closed before response");

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.compare(0, 5, "HTTP/") != 0)
        throw TransportError("malformed status line: " + status_line);
    std::string code = status_line.substr(sp1 + 1, 3);
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                                          [](char c) { return c >= '0' && c <= '9'; }))
        throw TransportError("malformed status line: " + status_line);
    head.status = std::stol(code);

    while (true) {
        std::string line;
        rc = read_line(conn, leftover, line);
        if (rc < 0) throw TransportError("read response headers: " + conn.error);
        if (rc == 0) throw TransportError("connection closed in response headers");
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = to_lower(line.substr(0, colon));
        std::string value = to_lower(line.substr(colon + 1));
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        if (name == "transfer-encoding") {
            head.is_chunked = (value.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            char* end = nullptr;
            unsigned long long len = std::strtoull(value.c_str(), &end, 10);
            if (end != value.c_str()) {
                head.has_length = true;
                head.content_length = static_cast<size_t>(len);
            }
        }
    }
    // Chunked wins over Content-Length (RFC 9112 §6.3)
    if (head.is_chunked) head.has_length = false;
    return head;
}

// ── Body reader (pull-based, dechunks if needed) ───────────────

class BodyReader {
public:
    BodyReader(Connection& conn, std::string& leftover, const ResponseHead& head)
        : conn_(conn), leftover_(leftover), chunked_(head.is_chunked),
          use_length_(head.has_length), remaining_(head.content_length) {
        if (use_length_ && remaining_ == 0) done_ = true;
    }

    // Returns >0 bytes, 0 at end of body. Throws TransportError.
    size_t read(char* buf, size_t len) {
        if (done_ || len == 0) return 0;
        if (chunked_) return read_chunked(buf, len);

        size_t want = use_length_ ? std::min(len, remaining_) : len;
        size_t n = read_raw(buf, want);
        if (n == 0) {
            done_ = true;
            if (use_length_ && remaining_ > 0)
                throw TransportError("connection closed before end of body");
            return 0;
        }
        if (use_length_) {
            remaining_ -= n;
            if (remaining_ == 0) done_ = true;
        }
        return n;
    }

private:
    // Serves leftover bytes first; 0 on EOF.
    size_t read_raw(char* buf, size_t len) {
        if (!leftover_.empty()) {
            size_t take = std::min(len, leftover_.size());
            std::memcpy(buf, leftover_.data(), take);
            leftover_.erase(0, take);
            return take;
        }
        ssize_t n = conn_.read_some(buf, len);
        if (n < 0) throw TransportError("read body: " + conn_.error);
        return static_cast<size_t>(n);
    }

    size_t read_chunked(char* buf, size_t len) {
        if (chunk_remaining_ == 0) {
            std::string line;
            if (!first_chunk_) {
                // CRLF that terminates the previous chunk's data
                int rc = read_line(conn_, leftover_, line);
                if (rc < 0) throw TransportError("read chunk: " + conn_.error);
                if (rc == 0) { done_ = true; return 0; }
            }
            first_chunk_ = false;
            int rc = read_line(conn_, leftover_, line);
            if (rc < 0) throw TransportError("read chunk size: " + conn_.error);
            if (rc == 0) { done_ = true; return 0; } // server closed between chunks
            // Chunk size is hex, may have extensions after ';'
            char* end = nullptr;
            unsigned long long size = std::strtoull(line.c_str(), &end, 16);
            if (end == line.c_str())
                throw TransportError("malformed chunk size: " + line);
            if (size == 0) { done_ = true; return 0; }
            chunk_remaining_ = static_cast<size_t>(size);
        }
        size_t n = read_raw(buf, std::min(len, chunk_remaining_));
        if (n == 0) { done_ = true; return 0; } // EOF mid-chunk: server closed
        chunk_remaining_ -= n;
        return n;
    }

    Connection& conn_;
    std::string& leftover_;
    bool chunked_;
    bool use_length_;
    size_t remaining_;
    size_t chunk_remaining_ = 0;
    bool first_chunk_ = true;
    bool done_ = false;
};

// ── Streaming response ─────────────────────────────────────────

class SocketStreamResponse : public StreamResponse {
public:
    SocketStreamResponse(std::unique_ptr<Connection> conn, CancelToken* cancel)
        : conn_(std::move(conn)), cancel_(cancel) {
        Connection* raw = conn_.get();
        registration_ = std::make_unique<CancelRegistration>(
            cancel_, [raw]() { raw->interrupt(); });
    }

    // Headers are parsed after registration so a cancel during the wait for
    // the response head also unblocks.
    void read_head() {
        try {
            head_ = parse_response_head(*conn_, leftover_);
        } catch (const TransportError&) {
            throw_if_cancelled();
            throw;
        }
        // SSE streams idle for long periods; only close or cancel ends a read.
        conn_->set_socket_timeout(0);
        body_ = std::make_unique<BodyReader>(*conn_, leftover_, head_);
    }

    long status_code() const override { return head_.status; }

    size_t read_some(char* buf, size_t len) override {
        throw_if_cancelled();
        size_t n = 0;
        try {
            n = body_->read(buf, len);
        } catch (const TransportError&) {
            throw_if_cancelled();
            throw;
        }
        // shutdown() makes recv() report EOF; that is not a server close.
        if (n == 0) throw_if_cancelled();
        return n;
    }

    ~SocketStreamResponse() override {
        // Deregister before the descriptor is closed.
        registration_.reset();
    }

private:
    void throw_if_cancelled() const {
        if (cancel_ && cancel_->cancelled())
            throw TransportError("connection interrupted: operation cancelled");
    }

    std::unique_ptr<Connection> conn_;
    CancelToken* cancel_;
    std::unique_ptr<CancelRegistration> registration_;
    std::string leftover_;
    ResponseHead head_;
    std::unique_ptr<BodyReader> body_;
};

static std::unique_ptr<Connection> open_connection(const ParsedUrl& url,
                                                   const std::string& method,
                                                   const std::string& body,
                                                   const std::vector<Header>& headers,
                                                   long timeout_secs) {
    auto conn = std::make_unique<Connection>();
    if (!conn->connect(url, timeout_secs))
        throw TransportError(conn->error);

    std::string request = build_request(method, url, body, headers);
    if (!conn->write_all(request.c_str(), request.size()))
        throw TransportError("send request: " + conn->error);
    return conn;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::request(const std::string& method,
                                        const std::string& url,
                                        const std::string& body,
                                        const std::vector<Header>& headers,
                                        long timeout_seconds) {
    ParsedUrl parsed = parse_url(url);
    auto conn = open_connection(parsed, method, body, headers, timeout_seconds);

    std::string leftover;
    ResponseHead head = parse_response_head(*conn, leftover);

    HttpResponse resp;
    resp.status_code = head.status;
    if (method == "HEAD" || head.status == 204 || head.status == 304)
        return resp;

    BodyReader reader(*conn, leftover, head);
    char buf[4096];
    for (;;) {
        size_t n = reader.read(buf, sizeof(buf));
        if (n == 0) break;
        resp.body.append(buf, n);
    }
    return resp;
}

std::unique_ptr<StreamResponse> SocketHttpClient::open_stream(const std::string& url,
                                                              const std::vector<Header>& headers,
                                                              CancelToken* cancel,
                                                              long timeout_seconds) {
    if (cancel && cancel->cancelled())
        throw TransportError("connection interrupted: operation cancelled");

    ParsedUrl parsed = parse_url(url);
    auto conn = open_connection(parsed, "GET", "", headers, timeout_seconds);

    auto resp = std::make_unique<SocketStreamResponse>(std::move(conn), cancel);
    resp->read_head();
    return resp;
}

} // namespace manax
