#pragma once
#include "config.hpp"
#include "connection_manager.hpp"
#include "event_loop.hpp"
#include "kv_store.hpp"
#include "message_cache.hpp"
#include <memory>

namespace chatlink {

// Process-lifetime services, built once from the loaded Config.
// Members are declared in dependency order so they are destroyed in reverse.
struct AppContext {
    std::unique_ptr<PollEventLoop> loop;
    std::unique_ptr<KvStore> store;
    std::unique_ptr<MessageCache> cache;
    std::unique_ptr<ConnectionManager> connection;

    static std::unique_ptr<AppContext> create(const Config& config);
};

CacheOptions cache_options_from(const Config& config);
ConnectionConfig connection_config_from(const Config& config);

} // namespace chatlink
