#include "../client.hpp"
#include "../util.hpp"

#include <stdexcept>

namespace manax {

static constexpr const char* FACTS_STREAM_OP = "StreamFacts";
static constexpr const char* FACTS_EVENT = "facts";

// GET /api/facts/items/stream?proId=...
//
// The server replays the current window as the first "facts" event, then
// pushes a chunk whenever items change. Idle periods are filled with
// comment keepalives.
FactsStream Client::open_facts_stream(const std::string& pro_id, CancelToken* cancel) {
    std::string id = trim(pro_id);
    if (id.empty())
        throw std::invalid_argument(std::string(FACTS_STREAM_OP) + ": proId must not be empty");

    std::string url = build_url("/api/facts/items/stream", {{"proId", id}});
    auto headers = apply_headers({{"Accept", "text/event-stream"}});

    auto response = open_event_stream(http_, url, headers, cancel, timeout_seconds_,
                                      FACTS_STREAM_OP);
    return FactsStream(std::move(response), FACTS_STREAM_OP, FACTS_EVENT, cancel);
}

StreamEnd Client::stream_facts(const std::string& pro_id, const FactsStreamHandler& handler,
                               CancelToken* cancel) {
    if (!handler)
        throw std::invalid_argument(std::string(FACTS_STREAM_OP) + ": handler must not be empty");

    auto session = open_facts_stream(pro_id, cancel);
    StreamEnd end = run_stream_session(session, handler);
    if (end == StreamEnd::ServerClosed)
        std::cerr << "[" << FACTS_EVENT << "] stream closed by server\n";
    return end;
}

} // namespace manax
