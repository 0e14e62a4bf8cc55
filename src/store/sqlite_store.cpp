#include "sqlite_store.hpp"
#include <sqlite3.h>
#include <filesystem>

namespace chatlink {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

SqliteKvStore::SqliteKvStore(const std::string& path, const std::string& ns)
    : path_(path), ns_(ns) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteKvStore: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    init_schema();
}

SqliteKvStore::~SqliteKvStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteKvStore::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS kv ("
        "  namespace TEXT NOT NULL,"
        "  key       TEXT NOT NULL,"
        "  value     TEXT NOT NULL,"
        "  PRIMARY KEY (namespace, key)"
        ");";
    char* err = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SqliteKvStore: schema init failed: " + msg);
    }
}

std::optional<std::string> SqliteKvStore::get(const std::string& key) {
    StmtGuard g;
    const char* sql = "SELECT value FROM kv WHERE namespace = ? AND key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return std::nullopt;
    sqlite3_bind_text(g.stmt, 1, ns_.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    const auto* text = sqlite3_column_text(g.stmt, 0);
    int len = sqlite3_column_bytes(g.stmt, 0);
    if (!text) return std::string();
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
}

void SqliteKvStore::put(const std::string& key, const std::string& value) {
    StmtGuard g;
    const char* sql =
        "INSERT INTO kv (namespace, key, value) VALUES (?, ?, ?) "
        "ON CONFLICT(namespace, key) DO UPDATE SET value = excluded.value;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteKvStore: prepare failed: ") +
                                 sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, ns_.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) return;
    if (rc == SQLITE_FULL || rc == SQLITE_TOOBIG) {
        throw StorageQuotaError(std::string("SqliteKvStore: ") + sqlite3_errmsg(db_));
    }
    throw std::runtime_error(std::string("SqliteKvStore: write failed: ") + sqlite3_errmsg(db_));
}

bool SqliteKvStore::remove(const std::string& key) {
    StmtGuard g;
    const char* sql = "DELETE FROM kv WHERE namespace = ? AND key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(g.stmt, 1, ns_.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

std::vector<std::string> SqliteKvStore::keys() {
    std::vector<std::string> out;
    StmtGuard g;
    const char* sql = "SELECT key FROM kv WHERE namespace = ? ORDER BY key;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return out;
    sqlite3_bind_text(g.stmt, 1, ns_.c_str(), -1, SQLITE_STATIC);
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        if (auto* v = sqlite3_column_text(g.stmt, 0)) {
            out.emplace_back(reinterpret_cast<const char*>(v));
        }
    }
    return out;
}

size_t SqliteKvStore::usage_bytes() {
    StmtGuard g;
    const char* sql =
        "SELECT COALESCE(SUM(LENGTH(CAST(key AS BLOB)) + LENGTH(CAST(value AS BLOB))), 0) "
        "FROM kv WHERE namespace = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    sqlite3_bind_text(g.stmt, 1, ns_.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<size_t>(sqlite3_column_int64(g.stmt, 0));
}

void SqliteKvStore::clear() {
    StmtGuard g;
    const char* sql = "DELETE FROM kv WHERE namespace = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return;
    sqlite3_bind_text(g.stmt, 1, ns_.c_str(), -1, SQLITE_STATIC);
    sqlite3_step(g.stmt);
}

} // namespace chatlink
