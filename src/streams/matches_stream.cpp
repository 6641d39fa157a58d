#include "../client.hpp"
#include "../util.hpp"

#include <stdexcept>

namespace manax {

static constexpr const char* MATCHES_STREAM_OP = "StreamMatches";
static constexpr const char* MATCHES_EVENT = "matches";

static std::invalid_argument matches_arg_error(const std::string& what) {
    return std::invalid_argument(std::string(MATCHES_STREAM_OP) + ": " + what);
}

// GET /api/matches/items/stream?proId&sinceUpdatedUtc&sinceId&direction[&filters]
//
// No snapshot is replayed: the server polls for rows after the cursor and
// emits a "matches" event per batch, ": idle" comments otherwise.
MatchesStream Client::open_matches_stream(const std::string& pro_id,
                                          const MatchesCursor& cursor,
                                          const MatchesFilter& filter,
                                          CancelToken* cancel) {
    std::string id = trim(pro_id);
    if (id.empty()) throw matches_arg_error("proId must not be empty");
    if (!filter.direction) throw matches_arg_error("direction must be set");
    if (cursor.id < 0) throw matches_arg_error("cursor.id must be >= 0");
    if (is_zero(cursor.updated_utc))
        throw matches_arg_error("cursor.updated_utc must not be zero");

    QueryParams q = {
        {"proId", id},
        {"sinceUpdatedUtc", format_rfc3339(cursor.updated_utc)},
        {"sinceId", std::to_string(cursor.id)},
    };
    append_matches_filter(q, filter);

    std::string url = build_url("/api/matches/items/stream", q);
    auto headers = apply_headers({{"Accept", "text/event-stream"}});

    auto response = open_event_stream(http_, url, headers, cancel, timeout_seconds_,
                                      MATCHES_STREAM_OP);
    return MatchesStream(std::move(response), MATCHES_STREAM_OP, MATCHES_EVENT, cancel);
}

StreamEnd Client::stream_matches(const std::string& pro_id, const MatchesCursor& cursor,
                                 const MatchesFilter& filter,
                                 const MatchesStreamHandler& handler, CancelToken* cancel) {
    if (!handler) throw matches_arg_error("handler must not be empty");

    auto session = open_matches_stream(pro_id, cursor, filter, cancel);
    StreamEnd end = run_stream_session(session, handler);
    if (end == StreamEnd::ServerClosed)
        std::cerr << "[" << MATCHES_EVENT << "] stream closed by server\n";
    return end;
}

} // namespace manax
