#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace manax {

struct Config {
    std::string base_url;       // e.g. https://api.manax.pro or https://manax.pro/manax
    std::string pro_id;         // X-Pro-Id
    std::string pro_token;      // X-Pro-Token
    std::string manax_key;      // X-Manax-Key for wallet creation
    long timeout_seconds = 30;  // connect + response head; streams then block freely

    // Load from ~/.manax/config.json + env vars
    static Config load();

    // Load from an explicit file + env vars. A missing file is not an error;
    // a malformed one is reported and ignored.
    static Config load_from(const std::string& path);

    // Fields present in j override the current values.
    void merge_json(const nlohmann::json& j);

    // MANAX_BASE_URL, MANAX_PRO_ID, MANAX_PRO_TOKEN, MANAX_KEY, MANAX_TIMEOUT
    void apply_env();
};

} // namespace manax
