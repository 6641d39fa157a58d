#include <catch2/catch.hpp>
#include "streams/sse.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

using namespace manax;

// Byte source delivering the given pieces one read at a time
static ByteReader pieces_source(std::vector<std::string> pieces) {
    auto state = std::make_shared<std::pair<std::vector<std::string>, size_t>>(
        std::move(pieces), 0);
    return [state](char* buf, size_t len) -> size_t {
        auto& [list, idx] = *state;
        while (idx < list.size() && list[idx].empty()) idx++;
        if (idx >= list.size()) return 0;
        std::string& piece = list[idx];
        size_t n = std::min(len, piece.size());
        std::memcpy(buf, piece.data(), n);
        piece.erase(0, n);
        if (piece.empty()) idx++;
        return n;
    };
}

// Helper: collect all events until end of stream
static std::vector<SSEEvent> collect_events(std::vector<std::string> pieces) {
    SSEReader reader(pieces_source(std::move(pieces)));
    std::vector<SSEEvent> events;
    while (auto ev = reader.read_event()) events.push_back(*ev);
    return events;
}

static std::vector<SSEEvent> collect_events(const std::string& stream) {
    return collect_events(std::vector<std::string>{stream});
}

// ── Basic event parsing ──────────────────────────────────────────

TEST_CASE("SSEReader: single data-only event", "[sse]") {
    auto events = collect_events("data: hello\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
    REQUIRE(events[0].event.empty());
    REQUIRE(events[0].comment.empty());
}

TEST_CASE("SSEReader: event with named type", "[sse]") {
    auto events = collect_events("event: facts\ndata: {}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "facts");
    REQUIRE(events[0].data == "{}");
}

TEST_CASE("SSEReader: multiple events in one chunk", "[sse]") {
    auto events = collect_events("data: first\n\ndata: second\n\n");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "first");
    REQUIRE(events[1].data == "second");
}

TEST_CASE("SSEReader: multi-line data joined with newline in order", "[sse]") {
    auto events = collect_events("event: matches\ndata: {\"a\":\ndata: 1,\ndata: \"b\":2}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "matches");
    REQUIRE(events[0].data == "{\"a\":\n1,\n\"b\":2}");
}

TEST_CASE("SSEReader: data field without space after colon", "[sse]") {
    auto events = collect_events("data:no_space\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "no_space");
}

TEST_CASE("SSEReader: only one leading space is stripped", "[sse]") {
    auto events = collect_events("data:   indented\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "  indented");
}

TEST_CASE("SSEReader: id and retry recorded verbatim, last wins", "[sse]") {
    auto events = collect_events("id: 1\nid: 42\nretry: 5000\ndata: x\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].id == "42");
    REQUIRE(events[0].retry == "5000");
    REQUIRE(events[0].data == "x");
}

TEST_CASE("SSEReader: unknown fields are ignored", "[sse]") {
    auto events = collect_events("foo: bar\ndata: x\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "x");
    REQUIRE(events[0].event.empty());
}

TEST_CASE("SSEReader: line without colon is a field with empty value", "[sse]") {
    auto events = collect_events("event\ndata\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event.empty());
    REQUIRE(events[0].data.empty());
}

TEST_CASE("SSEReader: empty data line followed by content keeps no leading newline",
          "[sse]") {
    auto events = collect_events("data:\ndata: x\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "x");
}

// ── Line endings ─────────────────────────────────────────────────

TEST_CASE("SSEReader: CRLF line endings", "[sse]") {
    auto events = collect_events("event: facts\r\ndata: {}\r\n\r\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "facts");
    REQUIRE(events[0].data == "{}");
}

// ── Comments ─────────────────────────────────────────────────────

TEST_CASE("SSEReader: comment-only frame", "[sse]") {
    auto events = collect_events(": text\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].comment == "text");
    REQUIRE(events[0].event.empty());
    REQUIRE(events[0].data.empty());
    REQUIRE(events[0].is_comment_only());
}

TEST_CASE("SSEReader: later comment overwrites earlier one", "[sse]") {
    auto events = collect_events(": matches-stream-start\n: idle\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].comment == "idle");
}

TEST_CASE("SSEReader: comment after fields is dropped", "[sse]") {
    auto events = collect_events("event: facts\n: inline\ndata: {}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].comment.empty());
    REQUIRE(events[0].event == "facts");
    REQUIRE(events[0].data == "{}");
    REQUIRE_FALSE(events[0].is_comment_only());
}

TEST_CASE("SSEReader: comment before data is not comment-only", "[sse]") {
    auto events = collect_events(": hi\ndata: x\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "x");
    REQUIRE_FALSE(events[0].is_comment_only());
}

// ── Frame boundaries ─────────────────────────────────────────────

TEST_CASE("SSEReader: blank lines before content produce no frames", "[sse]") {
    auto events = collect_events("\n\n\n\ndata: x\n\n\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "x");
}

TEST_CASE("SSEReader: only blank lines yield end of stream", "[sse]") {
    auto events = collect_events("\n\n");
    REQUIRE(events.empty());
}

TEST_CASE("SSEReader: truncated frame is discarded at end of stream", "[sse]") {
    auto events = collect_events("data: complete\n\nevent: facts\ndata: {\"id\":1}\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "complete");
}

TEST_CASE("SSEReader: unterminated last line is discarded", "[sse]") {
    auto events = collect_events("data: partial");
    REQUIRE(events.empty());
}

TEST_CASE("SSEReader: empty stream yields end of stream", "[sse]") {
    SSEReader reader(pieces_source({}));
    REQUIRE_FALSE(reader.read_event().has_value());
    // Stays at end of stream
    REQUIRE_FALSE(reader.read_event().has_value());
}

// ── Streaming / split delivery ───────────────────────────────────

TEST_CASE("SSEReader: event split across reads", "[sse]") {
    auto events = collect_events(std::vector<std::string>{
        "eve", "nt: fa", "cts\nda", "ta: {\"x\"", ":1}\n", "\n"});
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "facts");
    REQUIRE(events[0].data == "{\"x\":1}");
}

TEST_CASE("SSEReader: CRLF split between reads", "[sse]") {
    auto events = collect_events(std::vector<std::string>{"data: a\r", "\n\r", "\n"});
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "a");
}

TEST_CASE("SSEReader: byte-at-a-time delivery", "[sse]") {
    std::string stream = ": ping\n\nevent: matches\ndata: {\"items\":[]}\n\n";
    std::vector<std::string> pieces;
    for (char c : stream) pieces.emplace_back(1, c);

    auto events = collect_events(pieces);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].is_comment_only());
    REQUIRE(events[0].comment == "ping");
    REQUIRE(events[1].event == "matches");
    REQUIRE(events[1].data == "{\"items\":[]}");
}

TEST_CASE("SSEReader: large payload beyond internal buffer", "[sse]") {
    std::string big(20000, 'a');
    std::string stream;
    for (int i = 0; i < 3; i++) stream += "data: " + big + "\n\n";

    auto events = collect_events(stream);
    REQUIRE(events.size() == 3);
    for (const auto& ev : events) REQUIRE(ev.data == big);
}

// ── Errors ───────────────────────────────────────────────────────

TEST_CASE("SSEReader: source errors propagate unchanged", "[sse]") {
    int calls = 0;
    SSEReader reader([&calls](char* buf, size_t len) -> size_t {
        if (calls++ == 0) {
            const char* frame = "data: one\n\n";
            size_t n = std::min(len, std::strlen(frame));
            std::memcpy(buf, frame, n);
            return n;
        }
        throw TransportError("read body: Connection reset by peer");
    });

    auto first = reader.read_event();
    REQUIRE(first.has_value());
    REQUIRE(first->data == "one");
    REQUIRE_THROWS_AS(reader.read_event(), TransportError);
}
