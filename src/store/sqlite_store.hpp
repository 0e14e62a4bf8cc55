#pragma once
#include "../kv_store.hpp"

struct sqlite3; // forward declare

namespace chatlink {

// Single-table SQLite backend shared by all namespaces in one database file.
class SqliteKvStore : public KvStore {
public:
    SqliteKvStore(const std::string& path, const std::string& ns);
    ~SqliteKvStore() override;

    // Non-copyable
    SqliteKvStore(const SqliteKvStore&) = delete;
    SqliteKvStore& operator=(const SqliteKvStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> keys() override;
    size_t usage_bytes() override;
    void clear() override;

private:
    void init_schema();

    sqlite3* db_ = nullptr;
    std::string path_;
    std::string ns_;
};

} // namespace chatlink
