#include "errors.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

namespace manax {

static std::string format_api_error(long status, const std::string& message) {
    std::string out = "api error: status=" + std::to_string(status);
    if (!message.empty()) out += " message=\"" + message + "\"";
    return out;
}

ApiError::ApiError(long status, std::string message, std::string body)
    : Error(format_api_error(status, message)),
      status_(status), message_(std::move(message)), body_(std::move(body)) {}

std::string http_status_text(long status) {
    const char* reason = nullptr;
    switch (status) {
        case 400: reason = "Bad Request"; break;
        case 401: reason = "Unauthorized"; break;
        case 403: reason = "Forbidden"; break;
        case 404: reason = "Not Found"; break;
        case 405: reason = "Method Not Allowed"; break;
        case 406: reason = "Not Acceptable"; break;
        case 408: reason = "Request Timeout"; break;
        case 409: reason = "Conflict"; break;
        case 410: reason = "Gone"; break;
        case 413: reason = "Payload Too Large"; break;
        case 415: reason = "Unsupported Media Type"; break;
        case 422: reason = "Unprocessable Entity"; break;
        case 429: reason = "Too Many Requests"; break;
        case 500: reason = "Internal Server Error"; break;
        case 501: reason = "Not Implemented"; break;
        case 502: reason = "Bad Gateway"; break;
        case 503: reason = "Service Unavailable"; break;
        case 504: reason = "Gateway Timeout"; break;
        default: break;
    }
    if (!reason) return std::to_string(status);
    return std::to_string(status) + " " + reason;
}

ApiError classify_error_response(long status, const std::string& body) {
    std::string bounded = body.size() > ERROR_BODY_LIMIT
        ? body.substr(0, ERROR_BODY_LIMIT) : body;

    std::string message;
    auto parsed = nlohmann::json::parse(bounded, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() &&
        parsed.contains("error") && parsed["error"].is_string()) {
        message = trim(parsed["error"].get<std::string>());
    }
    if (message.empty() && !bounded.empty())
        message = trim(bounded);
    if (message.empty())
        message = http_status_text(status);

    return ApiError(status, message, bounded);
}

} // namespace manax
