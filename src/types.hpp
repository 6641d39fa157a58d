#pragma once
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace manax {

// ── Matching direction ──────────────────────────────────────────

// Offer: "who needs me?"; Seek: "who do I need?"
enum class MatchingDirection { Offer, Seek };

inline const char* direction_to_string(MatchingDirection d) {
    switch (d) {
        case MatchingDirection::Offer: return "Offer";
        case MatchingDirection::Seek: return "Seek";
    }
    return "Offer";
}

// Throws std::invalid_argument for anything but "Offer" / "Seek".
MatchingDirection direction_from_string(const std::string& s);

// ── Facts ───────────────────────────────────────────────────────

struct FactItem {
    int64_t id = 0;
    std::string pro_id;
    std::string fact_text;
    std::string fact_hash;
    std::string status;                       // "ok" | "stale" | "false"
    std::optional<std::string> false_reason;  // set when status == "false"
    Timestamp created_utc{};
    Timestamp last_seen_utc{};
    Timestamp updated_utc{};
    std::optional<std::string> review_status; // "ok" | "not" | null
    std::optional<Timestamp> review_updated_utc;
    bool is_writable = false;
};

// Facts window plus the (cursorUpdatedUtc, cursorId) watermark. Same shape
// for the snapshot endpoint, the updates endpoint and each "facts" event.
struct FactsChunk {
    std::string pro_id;
    Timestamp cursor_updated_utc{};
    int64_t cursor_id = 0;
    std::vector<FactItem> items;
};

// ── Matches ─────────────────────────────────────────────────────

struct MatchItem {
    int64_t id = 0;
    std::string pro_id;
    std::string target_pro_id;
    std::optional<MatchingDirection> direction;
    double score = 0.0;
    std::string rationale;
    std::string model_id;
    Timestamp created_utc{};
    Timestamp updated_utc{};
};

// Snapshot, updates and "matches" events. direction is null when the
// server reports both directions.
struct MatchesChunk {
    std::string pro_id;
    std::optional<MatchingDirection> direction;
    Timestamp cursor_updated_utc{};
    int64_t cursor_id = 0;
    std::vector<MatchItem> items;
};

// Progress watermark, ordered by (updated_utc, id).
struct MatchesCursor {
    Timestamp updated_utc{};
    int64_t id = 0;

    static MatchesCursor from(const MatchesChunk& chunk) {
        return {chunk.cursor_updated_utc, chunk.cursor_id};
    }

    bool operator==(const MatchesCursor& o) const {
        return updated_utc == o.updated_utc && id == o.id;
    }
    bool operator!=(const MatchesCursor& o) const { return !(*this == o); }
    bool operator<(const MatchesCursor& o) const {
        if (updated_utc != o.updated_utc) return updated_utc < o.updated_utc;
        return id < o.id;
    }
};

// Filters shared by the matches snapshot, updates and stream endpoints.
// Zero disables a numeric filter.
struct MatchesFilter {
    std::optional<MatchingDirection> direction;
    double min_score = 0.0;
    int limit = 0;                  // server default (e.g. 500) when 0
    int min_rationale_length = 0;
    int max_rationale_length = 0;
};

// ── Wallet ──────────────────────────────────────────────────────

struct CreateProWalletResponse {
    std::string pro_id;
    std::string token;
    std::string mnemonic24; // 24 space-separated words
    Timestamp created_utc{};
};

struct VerifyProWalletResponse {
    std::string pro_id;
    bool valid = false;
};

// ── Speech ──────────────────────────────────────────────────────

struct UploadSpeechAudioRequest {
    std::string pro_id;
    std::string session_id;
    int chunk_index = 0;
    std::string audio;      // binary content
    std::string file_name;  // "audio" when empty
    int sample_rate = 0;    // omitted when 0
};

struct SpeechUploadResponse {
    bool ok = false;
    bool existed = false;
    std::optional<int64_t> id;
    std::string pro_id;
    std::string session_id;
    int chunk_index = 0;
    std::optional<int> sample_rate;
    std::string stored_path;
    std::optional<std::string> wav16k_mono_path;
    std::string transcript;
};

struct UploadSpeechTextRequest {
    std::string pro_id;
    std::string session_id;
    int chunk_index = 0;
    std::string text;
};

struct SpeechStatusResponse {
    bool ok = false;
    bool found = false;
    std::optional<int64_t> id;
    std::string pro_id;
    std::string session_id;
    int chunk_index = 0;
    std::string asr_status;  // "pending" | "ok" | "error"
    std::optional<std::string> asr_error;
    std::string transcript;
    std::optional<double> duration_sec;
    std::optional<std::string> audio_sha256;
};

// ── Review status ───────────────────────────────────────────────

struct PatchReviewStatusResponse {
    std::string code; // "ok", "bad_request", ...
    std::optional<std::string> reason;
};

// ── JSON conversion ─────────────────────────────────────────────
// Missing or null fields keep their defaults; a present value of the wrong
// type throws nlohmann::json::exception, a bad timestamp throws
// std::invalid_argument. An unrecognized direction decodes as unset.

void from_json(const nlohmann::json& j, FactItem& v);
void from_json(const nlohmann::json& j, FactsChunk& v);
void from_json(const nlohmann::json& j, MatchItem& v);
void from_json(const nlohmann::json& j, MatchesChunk& v);
void from_json(const nlohmann::json& j, CreateProWalletResponse& v);
void from_json(const nlohmann::json& j, VerifyProWalletResponse& v);
void from_json(const nlohmann::json& j, SpeechUploadResponse& v);
void from_json(const nlohmann::json& j, SpeechStatusResponse& v);
void from_json(const nlohmann::json& j, PatchReviewStatusResponse& v);

void to_json(nlohmann::json& j, const UploadSpeechTextRequest& v);

} // namespace manax
