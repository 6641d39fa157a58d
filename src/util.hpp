#pragma once
#include <chrono>
#include <string>
#include <cstdint>

namespace manax {

using Timestamp = std::chrono::system_clock::time_point;

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Case-insensitive ASCII comparison (header names)
bool iequals(const std::string& a, const std::string& b);

// Percent-encode for use in a URL query component
std::string url_encode(const std::string& s);

// RFC 3339 UTC at seconds precision: 2025-01-01T00:00:00Z
std::string format_rfc3339(Timestamp t);

// Unix time of 0001-01-01T00:00:00Z
constexpr int64_t ZERO_TIME_UNIX_SECONDS = -62135596800LL;

// Parse RFC 3339 ("Z" or +hh:mm offsets, optional fractional seconds).
// 0001-01-01T00:00:00Z decodes to Timestamp{} (is_zero). Throws
// std::invalid_argument on malformed input or instants the clock cannot hold.
Timestamp parse_rfc3339(const std::string& s);

// True for the default-constructed time point
inline bool is_zero(Timestamp t) {
    return t.time_since_epoch().count() == 0;
}

// Shortest round-trippable decimal form of a double (no exponent for
// typical score values)
std::string format_double(double v);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Generate a simple unique ID (hex)
std::string generate_id();

} // namespace manax
