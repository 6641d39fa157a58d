#pragma once
#include <stdexcept>
#include <string>

namespace manax {

// Base of all errors raised by the client library.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connection setup failed (URL, DNS, connect, TLS, write) or a read on an
// open response failed.
class TransportError : public Error {
public:
    using Error::Error;
};

// The server answered with a status outside [200,299].
class ApiError : public Error {
public:
    ApiError(long status, std::string message, std::string body);

    long status() const { return status_; }
    const std::string& message() const { return message_; }
    // Raw response body bytes (possibly truncated to the read limit)
    const std::string& body() const { return body_; }

private:
    long status_;
    std::string message_;
    std::string body_;
};

// Server sent something the stream decoder cannot accept: a matching event
// without payload, or a payload that is not valid JSON for the feed.
class ProtocolError : public Error {
public:
    using Error::Error;
};

// The caller cancelled the operation through its CancelToken.
class CancelledError : public Error {
public:
    CancelledError() : Error("operation cancelled") {}
};

// Upper bound on the error body read before a stream is abandoned.
constexpr size_t ERROR_BODY_LIMIT = 64 * 1024;

// "400 Bad Request"; falls back to the bare number for unknown codes.
std::string http_status_text(long status);

// Build the typed error for a non-success response. The message comes from
// a JSON "error" string field, else the trimmed body, else the status text.
ApiError classify_error_response(long status, const std::string& body);

} // namespace manax
