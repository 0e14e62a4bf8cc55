#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace chatlink {

struct ConnectionSettings {
    std::string url = "ws://localhost:4001";
    uint32_t base_reconnect_interval_ms = 1500;
    uint32_t max_reconnect_attempts = 5;
    uint32_t connect_timeout_seconds = 10;
};

struct CacheSettings {
    std::string backend = "sqlite";  // sqlite | json | memory
    std::string path;                // empty = backend default under ~/.chatlink
    uint32_t max_messages_per_chat = 100;
    uint32_t max_cached_chats = 30;
    uint32_t max_storage_mb = 3;
    uint32_t cleanup_threshold_days = 30;
};

struct SessionSettings {
    uint32_t ack_timeout_ms = 30000;
    uint32_t mark_read_debounce_ms = 100;
};

struct Config {
    std::string user_id;  // empty = not logged in

    ConnectionSettings connection;
    CacheSettings cache;
    SessionSettings session;

    // Load from ~/.chatlink/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved storage location for the configured backend.
    std::string cache_path() const;
};

} // namespace chatlink
