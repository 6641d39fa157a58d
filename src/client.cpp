#include "client.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

namespace manax {

static std::string normalize_base_url(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) throw std::invalid_argument("base URL must not be empty");

    size_t cut = s.find_first_of("?#");
    if (cut != std::string::npos) s.erase(cut);

    size_t sep = s.find("://");
    bool scheme_ok = sep != std::string::npos && sep > 0 &&
                     std::isalpha(static_cast<unsigned char>(s[0]));
    for (size_t i = 0; scheme_ok && i < sep; i++) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') scheme_ok = false;
    }
    if (!scheme_ok)
        throw std::invalid_argument("base URL must include scheme and host: \"" + raw + "\"");

    size_t host_start = sep + 3;
    size_t host_end = s.find('/', host_start);
    if (host_end == std::string::npos) host_end = s.size();
    if (host_end == host_start)
        throw std::invalid_argument("base URL must include scheme and host: \"" + raw + "\"");

    while (s.size() > host_end && s.back() == '/') s.pop_back();
    return s;
}

template <typename T>
static T decode_response(const json& j, const std::string& op) {
    if (j.is_null()) return T{};
    try {
        return j.get<T>();
    } catch (const json::exception& e) {
        throw ProtocolError(op + ": decode JSON response: " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(op + ": decode JSON response: " + e.what());
    }
}

static std::string require_trimmed(const std::string& value, const std::string& op,
                                   const char* name) {
    std::string v = trim(value);
    if (v.empty()) throw std::invalid_argument(op + ": " + name + " must not be empty");
    return v;
}

Client::Client(const std::string& base_url, HttpClient& http)
    : http_(http), base_url_(normalize_base_url(base_url)) {}

Client Client::from_config(const Config& cfg, HttpClient& http) {
    Client client(cfg.base_url, http);
    client.set_auth(cfg.pro_id, cfg.pro_token);
    if (cfg.timeout_seconds > 0) client.set_timeout(cfg.timeout_seconds);
    return client;
}

void Client::set_auth(const std::string& pro_id, const std::string& pro_token) {
    pro_id_ = trim(pro_id);
    pro_token_ = trim(pro_token);
}

std::string Client::build_url(const std::string& path, const QueryParams& query) const {
    std::string rel = trim(path);
    if (rel.empty() || rel[0] != '/') rel.insert(0, "/");

    std::string url = base_url_ + rel;
    char sep = '?';
    for (const auto& [key, value] : query) {
        url += sep;
        url += url_encode(key);
        url += '=';
        url += url_encode(value);
        sep = '&';
    }
    return url;
}

std::vector<Header> Client::apply_headers(std::vector<Header> extra) const {
    if (!pro_id_.empty()) set_header(extra, "X-Pro-Id", pro_id_);
    if (!pro_token_.empty()) set_header(extra, "X-Pro-Token", pro_token_);
    if (find_header(extra, "Accept").empty()) set_header(extra, "Accept", "application/json");
    return extra;
}

json Client::do_json(const std::string& op, const std::string& method,
                     const std::string& url, const std::string& body,
                     const std::vector<Header>& headers) {
    HttpResponse resp;
    try {
        resp = http_.request(method, url, body, headers, timeout_seconds_);
    } catch (const TransportError& e) {
        throw TransportError(op + ": http request failed: " + e.what());
    }

    if (resp.status_code < 200 || resp.status_code >= 300)
        throw classify_error_response(resp.status_code, resp.body);

    if (resp.body.empty()) return nullptr;
    try {
        return json::parse(resp.body);
    } catch (const json::parse_error& e) {
        throw ProtocolError(op + ": decode JSON response: " + e.what());
    }
}

void append_matches_filter(QueryParams& query, const MatchesFilter& filter) {
    if (filter.direction)
        query.emplace_back("direction", direction_to_string(*filter.direction));
    if (filter.min_score > 0)
        query.emplace_back("minScore", format_double(filter.min_score));
    if (filter.limit > 0)
        query.emplace_back("limit", std::to_string(filter.limit));
    if (filter.min_rationale_length > 0)
        query.emplace_back("minRationaleLength", std::to_string(filter.min_rationale_length));
    if (filter.max_rationale_length > 0)
        query.emplace_back("maxRationaleLength", std::to_string(filter.max_rationale_length));
}

// ── Wallet ──────────────────────────────────────────────────────

CreateProWalletResponse Client::create_pro_wallet(const std::string& manax_key) {
    std::vector<Header> extra;
    std::string key = trim(manax_key);
    if (!key.empty()) extra.emplace_back("X-Manax-Key", key);

    json j = do_json("CreateProWallet", "POST", build_url("/api/crypto/pro-wallet/create"),
                     "", apply_headers(std::move(extra)));
    return decode_response<CreateProWalletResponse>(j, "CreateProWallet");
}

VerifyProWalletResponse Client::verify_pro_wallet(const std::string& pro_id,
                                                  const std::string& token) {
    const std::string op = "VerifyProWallet";
    QueryParams q = {
        {"proId", require_trimmed(pro_id, op, "proId")},
        {"token", require_trimmed(token, op, "token")},
    };
    json j = do_json(op, "GET", build_url("/api/crypto/pro-wallet/verify", q), "",
                     apply_headers());
    return decode_response<VerifyProWalletResponse>(j, op);
}

// ── Speech ──────────────────────────────────────────────────────

static std::string escape_quotes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\' || c == '"') out += '\\';
        out += c;
    }
    return out;
}

static void append_form_field(std::string& body, const std::string& boundary,
                              const std::string& name, const std::string& value) {
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
    body += value;
    body += "\r\n";
}

SpeechUploadResponse Client::upload_speech_audio(const UploadSpeechAudioRequest& req) {
    const std::string op = "UploadSpeechAudio";
    if (req.audio.empty()) throw std::invalid_argument(op + ": audio must not be empty");
    std::string pro_id = require_trimmed(req.pro_id, op, "proId");
    std::string session_id = require_trimmed(req.session_id, op, "sessionId");
    if (req.chunk_index < 0) throw std::invalid_argument(op + ": chunkIndex must be >= 0");

    std::string file_name = trim(req.file_name).empty() ? "audio" : req.file_name;
    std::string boundary = "manax-" + generate_id() + generate_id();

    std::string body;
    body.reserve(req.audio.size() + 1024);
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"audio\"; filename=\"" +
            escape_quotes(file_name) + "\"\r\n";
    body += "Content-Type: application/octet-stream\r\n\r\n";
    body += req.audio;
    body += "\r\n";
    append_form_field(body, boundary, "proId", pro_id);
    append_form_field(body, boundary, "sessionId", session_id);
    append_form_field(body, boundary, "chunkIndex", std::to_string(req.chunk_index));
    if (req.sample_rate > 0)
        append_form_field(body, boundary, "sampleRate", std::to_string(req.sample_rate));
    body += "--" + boundary + "--\r\n";

    auto headers = apply_headers({{"Content-Type", "multipart/form-data; boundary=" + boundary}});
    json j = do_json(op, "POST", build_url("/api/speech/upload"), body, headers);
    return decode_response<SpeechUploadResponse>(j, op);
}

json Client::upload_speech_text(const UploadSpeechTextRequest& req) {
    const std::string op = "UploadSpeechText";
    require_trimmed(req.pro_id, op, "proId");
    require_trimmed(req.session_id, op, "sessionId");
    if (req.chunk_index < 0) throw std::invalid_argument(op + ": chunkIndex must be >= 0");
    require_trimmed(req.text, op, "text");

    json payload = req;
    auto headers = apply_headers({{"Content-Type", "application/json"}});
    return do_json(op, "POST", build_url("/api/speech/text"), payload.dump(), headers);
}

SpeechStatusResponse Client::get_speech_status_by_id(int64_t id) {
    const std::string op = "GetSpeechStatusByID";
    if (id <= 0) throw std::invalid_argument(op + ": id must be > 0");

    QueryParams q = {{"id", std::to_string(id)}};
    json j = do_json(op, "GET", build_url("/api/speech/status", q), "", apply_headers());
    return decode_response<SpeechStatusResponse>(j, op);
}

SpeechStatusResponse Client::get_speech_status_by_key(const std::string& pro_id,
                                                      const std::string& session_id,
                                                      int chunk_index) {
    const std::string op = "GetSpeechStatusByKey";
    std::string session = require_trimmed(session_id, op, "sessionId");
    if (chunk_index < 0) throw std::invalid_argument(op + ": chunkIndex must be >= 0");

    QueryParams q;
    std::string pid = trim(pro_id);
    if (!pid.empty()) q.emplace_back("proId", pid);
    q.emplace_back("sessionId", session);
    q.emplace_back("chunkIndex", std::to_string(chunk_index));

    json j = do_json(op, "GET", build_url("/api/speech/status", q), "", apply_headers());
    return decode_response<SpeechStatusResponse>(j, op);
}

// ── Facts ───────────────────────────────────────────────────────

FactsChunk Client::get_facts_snapshot(const std::string& pro_id, int limit) {
    const std::string op = "GetFactsSnapshot";
    QueryParams q = {{"proId", require_trimmed(pro_id, op, "proId")}};
    if (limit > 0) q.emplace_back("limit", std::to_string(limit));

    json j = do_json(op, "GET", build_url("/api/facts/items/snapshot", q), "", apply_headers());
    return decode_response<FactsChunk>(j, op);
}

FactsChunk Client::get_facts_updates(const std::string& pro_id, Timestamp since_utc,
                                     int64_t since_id, int limit) {
    const std::string op = "GetFactsUpdates";
    QueryParams q = {{"proId", require_trimmed(pro_id, op, "proId")}};
    if (since_id < 0) throw std::invalid_argument(op + ": sinceId must be >= 0");
    if (!is_zero(since_utc)) q.emplace_back("sinceUpdatedUtc", format_rfc3339(since_utc));
    q.emplace_back("sinceId", std::to_string(since_id));
    if (limit > 0) q.emplace_back("limit", std::to_string(limit));

    json j = do_json(op, "GET", build_url("/api/facts/items/updates", q), "", apply_headers());
    return decode_response<FactsChunk>(j, op);
}

PatchReviewStatusResponse Client::patch_fact_review_status(const std::string& pro_id,
                                                           int64_t id,
                                                           const std::string& review_status) {
    const std::string op = "PatchFactReviewStatus";
    QueryParams q = {{"proId", require_trimmed(pro_id, op, "proId")}};
    if (id <= 0) throw std::invalid_argument(op + ": id must be > 0");

    json payload = {{"reviewStatus", trim(review_status)}};
    std::string path = "/api/facts/items/" + std::to_string(id) + "/review-status";
    auto headers = apply_headers({{"Content-Type", "application/json"}});
    json j = do_json(op, "PATCH", build_url(path, q), payload.dump(), headers);
    return decode_response<PatchReviewStatusResponse>(j, op);
}

// ── Matches ─────────────────────────────────────────────────────

MatchesChunk Client::get_matches_snapshot(const std::string& pro_id,
                                          const MatchesFilter& filter) {
    const std::string op = "GetMatchesSnapshot";
    QueryParams q = {{"proId", require_trimmed(pro_id, op, "proId")}};
    if (!filter.direction) throw std::invalid_argument(op + ": direction must be set");
    append_matches_filter(q, filter);

    json j = do_json(op, "GET", build_url("/api/matches/items/snapshot", q), "",
                     apply_headers());
    return decode_response<MatchesChunk>(j, op);
}

MatchesChunk Client::get_matches_updates(const std::string& pro_id, const MatchesCursor& since,
                                         const MatchesFilter& filter) {
    const std::string op = "GetMatchesUpdates";
    QueryParams q = {{"proId", require_trimmed(pro_id, op, "proId")}};
    if (since.id < 0) throw std::invalid_argument(op + ": sinceId must be >= 0");
    if (!is_zero(since.updated_utc))
        q.emplace_back("sinceUpdatedUtc", format_rfc3339(since.updated_utc));
    q.emplace_back("sinceId", std::to_string(since.id));
    append_matches_filter(q, filter);

    json j = do_json(op, "GET", build_url("/api/matches/items/updates", q), "",
                     apply_headers());
    return decode_response<MatchesChunk>(j, op);
}

} // namespace manax
