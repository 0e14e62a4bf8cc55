#include <catch2/catch.hpp>
#include "config.hpp"
#include "kv_store.hpp"
#include "store/file_store.hpp"
#include "store/memory_store.hpp"
#include "store/sqlite_store.hpp"
#include <algorithm>
#include <filesystem>
#include <unistd.h>

using namespace chatlink;

// RAII temp location under /tmp, removed on destruction.
struct TempPath {
    std::string path;

    explicit TempPath(const std::string& name)
        : path("/tmp/chatlink_" + name + "_" + std::to_string(getpid())) {
        std::filesystem::remove_all(path);
    }
    ~TempPath() {
        std::filesystem::remove_all(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;
};

// Behaviour every backend shares.
static void exercise_store(KvStore& store) {
    REQUIRE_FALSE(store.get("missing").has_value());

    store.put("chat_1_2", R"({"messages":[]})");
    store.put("chat_metadata", "{}");
    REQUIRE(store.get("chat_1_2") == std::optional<std::string>(R"({"messages":[]})"));

    store.put("chat_1_2", "replaced");
    REQUIRE(store.get("chat_1_2") == std::optional<std::string>("replaced"));

    auto keys = store.keys();
    std::sort(keys.begin(), keys.end());
    REQUIRE(keys == std::vector<std::string>{"chat_1_2", "chat_metadata"});
    REQUIRE(store.usage_bytes() > 0);

    REQUIRE(store.remove("chat_1_2"));
    REQUIRE_FALSE(store.remove("chat_1_2"));
    REQUIRE_FALSE(store.get("chat_1_2").has_value());

    store.clear();
    REQUIRE(store.keys().empty());
    REQUIRE(store.usage_bytes() == 0);
}

// ── MemoryKvStore ────────────────────────────────────────────────

TEST_CASE("MemoryKvStore: basic operations", "[kv_store]") {
    MemoryKvStore store;
    REQUIRE(store.backend_name() == "memory");
    exercise_store(store);
}

TEST_CASE("MemoryKvStore: usage counts keys and values", "[kv_store]") {
    MemoryKvStore store;
    store.put("ab", "cdef");
    REQUIRE(store.usage_bytes() == 6);
    store.put("ab", "c");
    REQUIRE(store.usage_bytes() == 3);
}

TEST_CASE("MemoryKvStore: capacity raises StorageQuotaError", "[kv_store]") {
    MemoryKvStore store(10);
    store.put("k", "12345");
    REQUIRE_THROWS_AS(store.put("k2", "123456789"), StorageQuotaError);
    REQUIRE_FALSE(store.get("k2").has_value());
    REQUIRE(store.usage_bytes() == 6);

    // Overwriting frees the old value first
    store.put("k", "123456789");
    REQUIRE(store.get("k") == std::optional<std::string>("123456789"));
}

// ── FileKvStore ──────────────────────────────────────────────────

TEST_CASE("FileKvStore: basic operations", "[kv_store]") {
    TempPath tmp("filekv");
    FileKvStore store(tmp.path, "msgcache_");
    REQUIRE(store.backend_name() == "json");
    exercise_store(store);
}

TEST_CASE("FileKvStore: keys with separators survive encoding", "[kv_store]") {
    TempPath tmp("filekv_enc");
    FileKvStore store(tmp.path, "msgcache_");
    store.put("chat_a/b c", "v");
    REQUIRE(store.get("chat_a/b c") == std::optional<std::string>("v"));
    REQUIRE(store.keys() == std::vector<std::string>{"chat_a/b c"});
}

TEST_CASE("FileKvStore: namespaces are isolated", "[kv_store]") {
    TempPath tmp("filekv_ns");
    FileKvStore a(tmp.path, "one_");
    FileKvStore b(tmp.path, "two_");
    a.put("k", "from a");
    REQUIRE_FALSE(b.get("k").has_value());
    b.clear();
    REQUIRE(a.get("k") == std::optional<std::string>("from a"));
}

TEST_CASE("FileKvStore: data persists across instances", "[kv_store]") {
    TempPath tmp("filekv_persist");
    {
        FileKvStore store(tmp.path, "msgcache_");
        store.put("chat_metadata", "{\"x\":1}");
    }
    FileKvStore reopened(tmp.path, "msgcache_");
    REQUIRE(reopened.get("chat_metadata") == std::optional<std::string>("{\"x\":1}"));
}

// ── SqliteKvStore ────────────────────────────────────────────────

TEST_CASE("SqliteKvStore: basic operations", "[kv_store]") {
    TempPath tmp("sqlitekv.db");
    SqliteKvStore store(tmp.path, "msgcache_");
    REQUIRE(store.backend_name() == "sqlite");
    exercise_store(store);
}

TEST_CASE("SqliteKvStore: namespaces share one file", "[kv_store]") {
    TempPath tmp("sqlitekv_ns.db");
    SqliteKvStore a(tmp.path, "one_");
    SqliteKvStore b(tmp.path, "two_");
    a.put("k", "from a");
    b.put("k", "from b");
    REQUIRE(a.get("k") == std::optional<std::string>("from a"));
    b.clear();
    REQUIRE(a.keys().size() == 1);
    REQUIRE(b.keys().empty());
}

TEST_CASE("SqliteKvStore: data persists across instances", "[kv_store]") {
    TempPath tmp("sqlitekv_persist.db");
    {
        SqliteKvStore store(tmp.path, "msgcache_");
        store.put("chat_1_2", "stored");
    }
    SqliteKvStore reopened(tmp.path, "msgcache_");
    REQUIRE(reopened.get("chat_1_2") == std::optional<std::string>("stored"));
}

// ── create_kv_store ──────────────────────────────────────────────

TEST_CASE("create_kv_store: picks backend from config", "[kv_store]") {
    TempPath tmp("factory");
    Config cfg;

    cfg.cache.backend = "memory";
    REQUIRE(create_kv_store(cfg, "ns_")->backend_name() == "memory");

    cfg.cache.backend = "json";
    cfg.cache.path = tmp.path + "/files";
    REQUIRE(create_kv_store(cfg, "ns_")->backend_name() == "json");

    cfg.cache.backend = "sqlite";
    cfg.cache.path = tmp.path + "/cache.db";
    REQUIRE(create_kv_store(cfg, "ns_")->backend_name() == "sqlite");

    cfg.cache.backend = "redis";
    REQUIRE(create_kv_store(cfg, "ns_")->backend_name() == "memory");
}
