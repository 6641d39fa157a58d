#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <random>
#include <stdexcept>

namespace manax {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::string url_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string format_rfc3339(Timestamp t) {
    std::time_t secs = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::seconds>(t));
    // to_time_t rounds toward zero for pre-epoch values; floor instead
    if (t < std::chrono::system_clock::from_time_t(secs)) --secs;
    std::tm tm_buf;
    gmtime_r(&secs, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

static int parse_digits(const std::string& s, size_t pos, size_t count) {
    if (pos + count > s.size())
        throw std::invalid_argument("invalid RFC 3339 timestamp: " + s);
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            throw std::invalid_argument("invalid RFC 3339 timestamp: " + s);
        value = value * 10 + (s[i] - '0');
    }
    return value;
}

static void expect_char(const std::string& s, size_t pos, const char* allowed) {
    if (pos >= s.size() || std::string(allowed).find(s[pos]) == std::string::npos)
        throw std::invalid_argument("invalid RFC 3339 timestamp: " + s);
}

Timestamp parse_rfc3339(const std::string& s) {
    // YYYY-MM-DDTHH:MM:SS[.frac](Z|+hh:mm|-hh:mm)
    std::tm tm_buf{};
    tm_buf.tm_year = parse_digits(s, 0, 4) - 1900;
    expect_char(s, 4, "-");
    tm_buf.tm_mon = parse_digits(s, 5, 2) - 1;
    expect_char(s, 7, "-");
    tm_buf.tm_mday = parse_digits(s, 8, 2);
    expect_char(s, 10, "Tt ");
    tm_buf.tm_hour = parse_digits(s, 11, 2);
    expect_char(s, 13, ":");
    tm_buf.tm_min = parse_digits(s, 14, 2);
    expect_char(s, 16, ":");
    tm_buf.tm_sec = parse_digits(s, 17, 2);

    if (tm_buf.tm_mon < 0 || tm_buf.tm_mon > 11 || tm_buf.tm_mday < 1 ||
        tm_buf.tm_mday > 31 || tm_buf.tm_hour > 23 || tm_buf.tm_min > 59 ||
        tm_buf.tm_sec > 60)
        throw std::invalid_argument("invalid RFC 3339 timestamp: " + s);

    size_t pos = 19;
    std::chrono::nanoseconds frac{0};
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t start = pos;
        int64_t nanos = 0;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == start)
            throw std::invalid_argument("invalid RFC 3339 timestamp: " + s);
        while (digits < 9) { nanos *= 10; ++digits; }
        frac = std::chrono::nanoseconds(nanos);
    }

    long offset_secs = 0;
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
        ++pos;
    } else {
        expect_char(s, pos, "+-");
        int sign = s[pos] == '-' ? -1 : 1;
        int oh = parse_digits(s, pos + 1, 2);
        expect_char(s, pos + 3, ":");
        int om = parse_digits(s, pos + 4, 2);
        offset_secs = sign * (oh * 3600L + om * 60L);
        pos += 6;
    }
    if (pos != s.size())
        throw std::invalid_argument("invalid RFC 3339 timestamp: " + s);

    int64_t secs = static_cast<int64_t>(timegm(&tm_buf)) - offset_secs;

    // 0001-01-01T00:00:00Z is the server's "no value" (DateTime.MinValue)
    if (secs == ZERO_TIME_UNIX_SECONDS && frac.count() == 0) return Timestamp{};

    using Clock = std::chrono::system_clock;
    constexpr int64_t max_secs =
        std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count() - 1;
    constexpr int64_t min_secs =
        std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::min()).count() + 1;
    if (secs < min_secs || secs > max_secs)
        throw std::invalid_argument("RFC 3339 timestamp out of range: " + s);

    return Clock::time_point(std::chrono::seconds(secs)) +
           std::chrono::duration_cast<Clock::duration>(frac);
}

std::string format_double(double v) {
    char buf[64];
    for (int prec = 0; prec <= 17; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*f", prec, v);
        if (std::strtod(buf, nullptr) == v) return buf;
    }
    return buf;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::string generate_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;
    uint64_t val = dist(gen);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(val));
    return buf;
}

} // namespace manax
