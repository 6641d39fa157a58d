#include <catch2/catch.hpp>
#include "util.hpp"
#include <cstdlib>
#include <ratio>
#include <stdexcept>

using namespace manax;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t\n hello world \r\n") == "hello world");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t  ").empty());
    REQUIRE(trim("").empty());
}

// ── Case helpers ─────────────────────────────────────────────────

TEST_CASE("iequals: ASCII case-insensitive", "[util]") {
    REQUIRE(iequals("Content-Length", "content-length"));
    REQUIRE_FALSE(iequals("Content-Length", "Content-Type"));
    REQUIRE_FALSE(iequals("abc", "abcd"));
    REQUIRE(to_lower("Transfer-Encoding") == "transfer-encoding");
}

// ── url_encode ───────────────────────────────────────────────────

TEST_CASE("url_encode: unreserved characters unchanged", "[util]") {
    REQUIRE(url_encode("p_123-abc.def~") == "p_123-abc.def~");
}

TEST_CASE("url_encode: reserved characters escaped, space as plus", "[util]") {
    REQUIRE(url_encode("a b") == "a+b");
    REQUIRE(url_encode("2025-01-01T00:00:00Z") == "2025-01-01T00%3A00%3A00Z");
    REQUIRE(url_encode("a&b=c/d?") == "a%26b%3Dc%2Fd%3F");
    REQUIRE(url_encode("\xC3\xA6") == "%C3%A6");
}

// ── RFC 3339 ─────────────────────────────────────────────────────

TEST_CASE("format_rfc3339: epoch and known instant", "[util]") {
    REQUIRE(format_rfc3339(std::chrono::system_clock::from_time_t(0)) ==
            "1970-01-01T00:00:00Z");
    REQUIRE(format_rfc3339(std::chrono::system_clock::from_time_t(1735689600)) ==
            "2025-01-01T00:00:00Z");
}

TEST_CASE("format_rfc3339: truncates to seconds", "[util]") {
    auto t = std::chrono::system_clock::from_time_t(1735689600) +
             std::chrono::milliseconds(999);
    REQUIRE(format_rfc3339(t) == "2025-01-01T00:00:00Z");
}

TEST_CASE("parse_rfc3339: Z and offsets normalize to UTC", "[util]") {
    auto utc = parse_rfc3339("2025-01-01T00:00:00Z");
    REQUIRE(utc == std::chrono::system_clock::from_time_t(1735689600));
    REQUIRE(parse_rfc3339("2025-01-01T02:00:00+02:00") == utc);
    REQUIRE(parse_rfc3339("2024-12-31T19:30:00-04:30") == utc);
    REQUIRE(parse_rfc3339("2025-01-01t00:00:00z") == utc);
}

TEST_CASE("parse_rfc3339: fractional seconds kept", "[util]") {
    auto t = parse_rfc3339("2025-01-01T00:00:00.250Z");
    REQUIRE(t - std::chrono::system_clock::from_time_t(1735689600) ==
            std::chrono::milliseconds(250));
    REQUIRE(format_rfc3339(t) == "2025-01-01T00:00:00Z");

    // Server timestamps with 7 fractional digits
    auto t7 = parse_rfc3339("2025-01-01T00:00:00.1234567Z");
    REQUIRE(t7 - std::chrono::system_clock::from_time_t(1735689600) ==
            std::chrono::microseconds(123456) + std::chrono::nanoseconds(700));
}

TEST_CASE("parse_rfc3339: malformed input throws", "[util]") {
    REQUIRE_THROWS_AS(parse_rfc3339(""), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_rfc3339("yesterday"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_rfc3339("2025-01-01"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_rfc3339("2025-01-01T00:00:00"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_rfc3339("2025-13-01T00:00:00Z"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_rfc3339("2025-01-01T00:00:00.Z"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_rfc3339("2025-01-01T00:00:00Zjunk"), std::invalid_argument);
}

TEST_CASE("parse_rfc3339: year 0001 minimum is the zero time", "[util]") {
    REQUIRE(is_zero(parse_rfc3339("0001-01-01T00:00:00Z")));
    REQUIRE(is_zero(parse_rfc3339("0001-01-01T00:00:00.0000000Z")));
    REQUIRE(parse_rfc3339("0001-01-01T00:00:00Z") == Timestamp{});
}

TEST_CASE("parse_rfc3339: instants outside the clock range throw", "[util]") {
    // A nanosecond system_clock spans roughly 1677 to 2262
    if (!std::ratio_equal<std::chrono::system_clock::period, std::nano>::value) return;
    REQUIRE_THROWS_AS(parse_rfc3339("0001-01-01T00:00:01Z"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_rfc3339("1600-06-01T00:00:00Z"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_rfc3339("9999-12-31T23:59:59Z"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_rfc3339("9999-12-31T23:59:59.9999999Z"), std::invalid_argument);
}

TEST_CASE("parse_rfc3339: far but representable instants round-trip", "[util]") {
    REQUIRE(format_rfc3339(parse_rfc3339("1900-03-01T12:00:00Z")) == "1900-03-01T12:00:00Z");
    REQUIRE(format_rfc3339(parse_rfc3339("2200-12-31T23:59:59Z")) == "2200-12-31T23:59:59Z");
}

TEST_CASE("is_zero: only the default time point", "[util]") {
    REQUIRE(is_zero(Timestamp{}));
    REQUIRE_FALSE(is_zero(parse_rfc3339("2025-01-01T00:00:00Z")));
}

// ── format_double ────────────────────────────────────────────────

TEST_CASE("format_double: shortest plain decimal", "[util]") {
    REQUIRE(format_double(0.75) == "0.75");
    REQUIRE(format_double(0.1) == "0.1");
    REQUIRE(format_double(2.0) == "2");
    REQUIRE(format_double(0.333) == "0.333");
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/etc/manax.json") == "/etc/manax.json");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/.manax/config.json") ==
                std::string(home) + "/.manax/config.json");
    }
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 hex characters, distinct", "[util]") {
    auto a = generate_id();
    auto b = generate_id();
    REQUIRE(a.size() == 16);
    REQUIRE(a.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(a != b);
}
