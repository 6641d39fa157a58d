#pragma once
#include "http.hpp"
#include "types.hpp"
#include "streams/stream_session.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace manax {

struct Config;
class CancelToken;

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Invoked synchronously from the read loop, one payload at a time.
// Return false to stop the stream; exceptions propagate to the caller.
using FactsStreamHandler = std::function<bool(const FactsChunk&)>;
using MatchesStreamHandler = std::function<bool(const MatchesChunk&)>;

using FactsStream = StreamSession<FactsChunk>;
using MatchesStream = StreamSession<MatchesChunk>;

// High-level client for the Manax API service.
//
// Every request carries X-Pro-Id / X-Pro-Token when identity is configured.
// Non-2xx responses throw ApiError, transport failures TransportError,
// undecodable 2xx bodies ProtocolError, bad arguments std::invalid_argument.
// Not safe to call set_auth() concurrently with in-flight requests.
class Client {
public:
    // base_url: scheme + host + optional base path. Query and fragment are
    // dropped. Throws std::invalid_argument when empty or lacking scheme/host.
    Client(const std::string& base_url, HttpClient& http);

    // Base URL, identity and timeout taken from cfg.
    static Client from_config(const Config& cfg, HttpClient& http);

    // Empty values disable the corresponding header.
    void set_auth(const std::string& pro_id, const std::string& pro_token);

    void set_timeout(long seconds) { timeout_seconds_ = seconds; }
    long timeout() const { return timeout_seconds_; }

    // scheme://host[/base/path], no trailing slash
    const std::string& base_url() const { return base_url_; }
    const std::string& pro_id() const { return pro_id_; }

    // ── Wallet ───────────────────────────────────────────────────

    // POST /api/crypto/pro-wallet/create. manax_key is sent as X-Manax-Key
    // when non-empty.
    CreateProWalletResponse create_pro_wallet(const std::string& manax_key = "");

    // GET /api/crypto/pro-wallet/verify
    VerifyProWalletResponse verify_pro_wallet(const std::string& pro_id,
                                              const std::string& token);

    // ── Speech ───────────────────────────────────────────────────

    // POST /api/speech/upload (multipart/form-data)
    SpeechUploadResponse upload_speech_audio(const UploadSpeechAudioRequest& req);

    // POST /api/speech/text. The response shape is server-defined and
    // returned as raw JSON.
    nlohmann::json upload_speech_text(const UploadSpeechTextRequest& req);

    SpeechStatusResponse get_speech_status_by_id(int64_t id);

    // pro_id may be empty (server falls back to its default identity)
    SpeechStatusResponse get_speech_status_by_key(const std::string& pro_id,
                                                  const std::string& session_id,
                                                  int chunk_index);

    // ── Facts ────────────────────────────────────────────────────

    FactsChunk get_facts_snapshot(const std::string& pro_id, int limit = 0);

    // since_utc may be zero (no lower time bound)
    FactsChunk get_facts_updates(const std::string& pro_id, Timestamp since_utc,
                                 int64_t since_id, int limit = 0);

    // review_status: "ok", "not", or "" to clear
    PatchReviewStatusResponse patch_fact_review_status(const std::string& pro_id, int64_t id,
                                                       const std::string& review_status);

    // Replays the current facts window on connect, then pushes changes.
    StreamEnd stream_facts(const std::string& pro_id, const FactsStreamHandler& handler,
                           CancelToken* cancel = nullptr);
    FactsStream open_facts_stream(const std::string& pro_id, CancelToken* cancel = nullptr);

    // ── Matches ──────────────────────────────────────────────────

    // filter.direction is required
    MatchesChunk get_matches_snapshot(const std::string& pro_id, const MatchesFilter& filter);

    // filter.direction unset fetches both directions
    MatchesChunk get_matches_updates(const std::string& pro_id, const MatchesCursor& since,
                                     const MatchesFilter& filter);

    // Emits only changes after cursor; obtain it from get_matches_snapshot()
    // and thread each chunk's cursor into the next reconnect.
    // filter.direction is required, cursor.updated_utc must be non-zero.
    StreamEnd stream_matches(const std::string& pro_id, const MatchesCursor& cursor,
                             const MatchesFilter& filter, const MatchesStreamHandler& handler,
                             CancelToken* cancel = nullptr);
    MatchesStream open_matches_stream(const std::string& pro_id, const MatchesCursor& cursor,
                                      const MatchesFilter& filter,
                                      CancelToken* cancel = nullptr);

    // ── Request plumbing ─────────────────────────────────────────

    // Base path joined with path, plus the encoded query.
    std::string build_url(const std::string& path, const QueryParams& query = {}) const;

    // extra plus identity headers; Accept defaults to application/json.
    std::vector<Header> apply_headers(std::vector<Header> extra = {}) const;

private:
    // Send a request and return the parsed 2xx body (null when empty).
    nlohmann::json do_json(const std::string& op, const std::string& method,
                           const std::string& url, const std::string& body,
                           const std::vector<Header>& headers);

    HttpClient& http_;
    std::string base_url_;
    std::string pro_id_;
    std::string pro_token_;
    long timeout_seconds_ = 30;
};

// Query parameters for the matches filter; numeric filters only when > 0.
void append_matches_filter(QueryParams& query, const MatchesFilter& filter);

} // namespace manax
