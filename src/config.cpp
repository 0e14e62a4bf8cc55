#include "config.hpp"
#include "util.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chatlink {

nlohmann::json Config::defaults_json() {
    return {
        {"user_id", ""},
        {"connection", {
            {"url", "ws://localhost:4001"},
            {"base_reconnect_interval_ms", 1500},
            {"max_reconnect_attempts", 5},
            {"connect_timeout_seconds", 10}
        }},
        {"cache", {
            {"backend", "sqlite"},
            {"path", ""},
            {"max_messages_per_chat", 100},
            {"max_cached_chats", 30},
            {"max_storage_mb", 3},
            {"cleanup_threshold_days", 30}
        }},
        {"session", {
            {"ack_timeout_ms", 30000},
            {"mark_read_debounce_ms", 100}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::load() {
    Config cfg;
    std::string config_path = expand_home("~/.chatlink/config.json");

    nlohmann::json j;
    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) {
                std::cerr << "[config] Ignoring " << config_path << ": root is not an object\n";
                j = defaults_json();
            } else {
                j = merge_defaults(original, defaults_json());
            }
            if (original.is_object() && j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                else
                    std::cerr << "[config] Could not update " << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
        else
            std::cerr << "[config] Could not create " << config_path << "\n";
    }

    if (j.contains("user_id")) {
        if (j["user_id"].is_string())
            cfg.user_id = j["user_id"].get<std::string>();
        else if (j["user_id"].is_number_integer())
            cfg.user_id = std::to_string(j["user_id"].get<int64_t>());
    }

    if (j.contains("connection") && j["connection"].is_object()) {
        auto& c = j["connection"];
        read_string(c, "url", cfg.connection.url);
        read_uint(c, "base_reconnect_interval_ms", cfg.connection.base_reconnect_interval_ms);
        read_uint(c, "max_reconnect_attempts", cfg.connection.max_reconnect_attempts);
        read_uint(c, "connect_timeout_seconds", cfg.connection.connect_timeout_seconds);
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& m = j["cache"];
        read_string(m, "backend", cfg.cache.backend);
        read_string(m, "path", cfg.cache.path);
        read_uint(m, "max_messages_per_chat", cfg.cache.max_messages_per_chat);
        read_uint(m, "max_cached_chats", cfg.cache.max_cached_chats);
        read_uint(m, "max_storage_mb", cfg.cache.max_storage_mb);
        read_uint(m, "cleanup_threshold_days", cfg.cache.cleanup_threshold_days);
    }

    if (j.contains("session") && j["session"].is_object()) {
        auto& s = j["session"];
        read_uint(s, "ack_timeout_ms", cfg.session.ack_timeout_ms);
        read_uint(s, "mark_read_debounce_ms", cfg.session.mark_read_debounce_ms);
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("CHATLINK_URL"))
        cfg.connection.url = v;
    if (const char* v = std::getenv("CHATLINK_USER_ID"))
        cfg.user_id = v;
    if (const char* v = std::getenv("CHATLINK_STORE"))
        cfg.cache.backend = v;
    if (const char* v = std::getenv("CHATLINK_STORE_PATH"))
        cfg.cache.path = v;

    return cfg;
}

std::string Config::cache_path() const {
    if (!cache.path.empty()) return expand_home(cache.path);
    if (cache.backend == "json") return expand_home("~/.chatlink/cache");
    return expand_home("~/.chatlink/cache.db");
}

} // namespace chatlink
