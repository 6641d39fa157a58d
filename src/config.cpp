#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace manax {

Config Config::load() {
    return load_from(expand_home("~/.manax/config.json"));
}

Config Config::load_from(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json j = nlohmann::json::parse(file);
            if (j.is_object()) {
                cfg.merge_json(j);
                std::cerr << "[config] Loaded config: " << path << "\n";
            } else {
                std::cerr << "[config] Ignoring " << path << ": not a JSON object\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << path << ": " << e.what() << "\n";
        }
    }

    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

void Config::merge_json(const nlohmann::json& j) {
    if (j.contains("base_url") && j["base_url"].is_string())
        base_url = trim(j["base_url"].get<std::string>());
    if (j.contains("pro_id") && j["pro_id"].is_string())
        pro_id = trim(j["pro_id"].get<std::string>());
    if (j.contains("pro_token") && j["pro_token"].is_string())
        pro_token = trim(j["pro_token"].get<std::string>());
    if (j.contains("manax_key") && j["manax_key"].is_string())
        manax_key = trim(j["manax_key"].get<std::string>());
    if (j.contains("timeout") && j["timeout"].is_number_integer()) {
        long t = j["timeout"].get<long>();
        if (t > 0) timeout_seconds = t;
    }
}

void Config::apply_env() {
    if (const char* v = std::getenv("MANAX_BASE_URL"))
        base_url = trim(v);
    if (const char* v = std::getenv("MANAX_PRO_ID"))
        pro_id = trim(v);
    if (const char* v = std::getenv("MANAX_PRO_TOKEN"))
        pro_token = trim(v);
    if (const char* v = std::getenv("MANAX_KEY"))
        manax_key = trim(v);
    if (const char* v = std::getenv("MANAX_TIMEOUT")) {
        try {
            long t = std::stol(v);
            if (t > 0) timeout_seconds = t;
            else std::cerr << "[config] MANAX_TIMEOUT must be positive, got " << v << "\n";
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring non-numeric MANAX_TIMEOUT: " << v << "\n";
        }
    }
}

} // namespace manax
