#include "app_context.hpp"
#include "websocket.hpp"

namespace chatlink {

CacheOptions cache_options_from(const Config& config) {
    CacheOptions opts;
    opts.max_messages_per_chat = config.cache.max_messages_per_chat;
    opts.max_cached_chats = config.cache.max_cached_chats;
    opts.max_storage_bytes = static_cast<size_t>(config.cache.max_storage_mb) * 1024 * 1024;
    opts.cleanup_threshold_days = config.cache.cleanup_threshold_days;
    return opts;
}

ConnectionConfig connection_config_from(const Config& config) {
    ConnectionConfig cc;
    cc.url = config.connection.url;
    cc.base_reconnect_interval_ms = config.connection.base_reconnect_interval_ms;
    cc.max_reconnect_attempts = config.connection.max_reconnect_attempts;
    return cc;
}

std::unique_ptr<AppContext> AppContext::create(const Config& config) {
    auto ctx = std::make_unique<AppContext>();
    ctx->loop = std::make_unique<PollEventLoop>();
    ctx->store = create_kv_store(config, MessageCache::kNamespace);
    ctx->cache = std::make_unique<MessageCache>(*ctx->store, *ctx->loop,
                                                cache_options_from(config));

    auto transport = std::make_unique<WebSocketTransport>(
        *ctx->loop, static_cast<long>(config.connection.connect_timeout_seconds));
    ctx->connection = std::make_unique<ConnectionManager>(
        std::move(transport), *ctx->loop, connection_config_from(config));
    return ctx;
}

} // namespace chatlink
