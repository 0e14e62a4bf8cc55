#include "kv_store.hpp"
#include "config.hpp"
#include "store/file_store.hpp"
#include "store/memory_store.hpp"
#include "store/sqlite_store.hpp"
#include <iostream>

namespace chatlink {

std::unique_ptr<KvStore> create_kv_store(const Config& config, const std::string& ns) {
    const auto& backend = config.cache.backend;

    if (backend == "sqlite") {
        return std::make_unique<SqliteKvStore>(config.cache_path(), ns);
    }
    if (backend == "json") {
        return std::make_unique<FileKvStore>(config.cache_path(), ns);
    }
    if (backend != "memory") {
        std::cerr << "[config] Unknown cache backend '" << backend
                  << "', using memory\n";
    }
    return std::make_unique<MemoryKvStore>();
}

} // namespace chatlink
