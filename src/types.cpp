#include "types.hpp"

#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace manax {

MatchingDirection direction_from_string(const std::string& s) {
    if (s == "Offer") return MatchingDirection::Offer;
    if (s == "Seek") return MatchingDirection::Seek;
    throw std::invalid_argument("unknown matching direction: \"" + s + "\"");
}

// ── Field helpers ───────────────────────────────────────────────

static void require_object(const json& j, const char* what) {
    if (!j.is_object())
        throw std::invalid_argument(std::string(what) + ": expected JSON object, got " +
                                    j.type_name());
}

template <typename T>
static void read_field(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    out = it->template get<T>();
}

template <typename T>
static void read_field(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->template get<T>();
}

static void read_time(const json& j, const char* key, Timestamp& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    out = parse_rfc3339(it->get<std::string>());
}

static void read_time(const json& j, const char* key, std::optional<Timestamp>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = parse_rfc3339(it->get<std::string>());
}

static void read_direction(const json& j, const char* key,
                           std::optional<MatchingDirection>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    std::string s = it->get<std::string>();
    if (s == "Offer") out = MatchingDirection::Offer;
    else if (s == "Seek") out = MatchingDirection::Seek;
    else {
        // Newer server values are tolerated; the item is still delivered
        if (!s.empty())
            std::cerr << "[matches] unknown direction \"" << s << "\", left unset\n";
        out.reset();
    }
}

template <typename T>
static void read_items(const json& j, std::vector<T>& out) {
    out.clear();
    auto it = j.find("items");
    if (it == j.end() || it->is_null()) return;
    if (!it->is_array())
        throw std::invalid_argument(std::string("items: expected JSON array, got ") +
                                    it->type_name());
    out.reserve(it->size());
    for (const auto& item : *it) out.push_back(item.get<T>());
}

// ── Facts ───────────────────────────────────────────────────────

void from_json(const json& j, FactItem& v) {
    require_object(j, "FactItem");
    read_field(j, "id", v.id);
    read_field(j, "proId", v.pro_id);
    read_field(j, "factText", v.fact_text);
    read_field(j, "factHash", v.fact_hash);
    read_field(j, "status", v.status);
    read_field(j, "falseReason", v.false_reason);
    read_time(j, "createdUtc", v.created_utc);
    read_time(j, "lastSeenUtc", v.last_seen_utc);
    read_time(j, "updatedUtc", v.updated_utc);
    read_field(j, "reviewStatus", v.review_status);
    read_time(j, "reviewUpdatedUtc", v.review_updated_utc);
    read_field(j, "isWritable", v.is_writable);
}

void from_json(const json& j, FactsChunk& v) {
    require_object(j, "FactsChunk");
    read_field(j, "proId", v.pro_id);
    read_time(j, "cursorUpdatedUtc", v.cursor_updated_utc);
    read_field(j, "cursorId", v.cursor_id);
    read_items(j, v.items);
}

// ── Matches ─────────────────────────────────────────────────────

void from_json(const json& j, MatchItem& v) {
    require_object(j, "MatchItem");
    read_field(j, "id", v.id);
    read_field(j, "proId", v.pro_id);
    read_field(j, "targetProId", v.target_pro_id);
    read_direction(j, "direction", v.direction);
    read_field(j, "score", v.score);
    read_field(j, "rationale", v.rationale);
    read_field(j, "modelId", v.model_id);
    read_time(j, "createdUtc", v.created_utc);
    read_time(j, "updatedUtc", v.updated_utc);
}

void from_json(const json& j, MatchesChunk& v) {
    require_object(j, "MatchesChunk");
    read_field(j, "proId", v.pro_id);
    read_direction(j, "direction", v.direction);
    read_time(j, "cursorUpdatedUtc", v.cursor_updated_utc);
    read_field(j, "cursorId", v.cursor_id);
    read_items(j, v.items);
}

// ── Wallet ──────────────────────────────────────────────────────

void from_json(const json& j, CreateProWalletResponse& v) {
    require_object(j, "CreateProWalletResponse");
    read_field(j, "proId", v.pro_id);
    read_field(j, "token", v.token);
    read_field(j, "mnemonic24", v.mnemonic24);
    read_time(j, "createdUtc", v.created_utc);
}

void from_json(const json& j, VerifyProWalletResponse& v) {
    require_object(j, "VerifyProWalletResponse");
    read_field(j, "proId", v.pro_id);
    read_field(j, "valid", v.valid);
}

// ── Speech ──────────────────────────────────────────────────────

void from_json(const json& j, SpeechUploadResponse& v) {
    require_object(j, "SpeechUploadResponse");
    read_field(j, "ok", v.ok);
    read_field(j, "existed", v.existed);
    read_field(j, "id", v.id);
    read_field(j, "proId", v.pro_id);
    read_field(j, "sessionId", v.session_id);
    read_field(j, "chunkIndex", v.chunk_index);
    read_field(j, "sampleRate", v.sample_rate);
    read_field(j, "storedPath", v.stored_path);
    read_field(j, "wav16kMonoPath", v.wav16k_mono_path);
    read_field(j, "transcript", v.transcript);
}

void from_json(const json& j, SpeechStatusResponse& v) {
    require_object(j, "SpeechStatusResponse");
    read_field(j, "ok", v.ok);
    read_field(j, "found", v.found);
    read_field(j, "id", v.id);
    read_field(j, "proId", v.pro_id);
    read_field(j, "sessionId", v.session_id);
    read_field(j, "chunkIndex", v.chunk_index);
    read_field(j, "asrStatus", v.asr_status);
    read_field(j, "asrError", v.asr_error);
    read_field(j, "transcript", v.transcript);
    read_field(j, "durationSec", v.duration_sec);
    read_field(j, "audioSha256", v.audio_sha256);
}

void to_json(json& j, const UploadSpeechTextRequest& v) {
    j = json{
        {"proId", v.pro_id},
        {"sessionId", v.session_id},
        {"chunkIndex", v.chunk_index},
        {"text", v.text}
    };
}

// ── Review status ───────────────────────────────────────────────

void from_json(const json& j, PatchReviewStatusResponse& v) {
    require_object(j, "PatchReviewStatusResponse");
    read_field(j, "code", v.code);
    read_field(j, "reason", v.reason);
}

} // namespace manax
