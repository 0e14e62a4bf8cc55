#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chatlink {

struct Config; // forward declaration

// Thrown by KvStore::put when the backend has no room for the value.
class StorageQuotaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable string key/value store. Every instance is bound to one namespace;
// keys passed in and returned are relative to it.
class KvStore {
public:
    virtual ~KvStore() = default;

    virtual std::string backend_name() const = 0;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    // Insert or overwrite. Throws StorageQuotaError when full, std::runtime_error
    // on other write failures.
    virtual void put(const std::string& key, const std::string& value) = 0;

    // Returns true if the key existed.
    virtual bool remove(const std::string& key) = 0;

    virtual std::vector<std::string> keys() = 0;

    // Bytes used by this namespace (keys plus values).
    virtual size_t usage_bytes() = 0;

    // Remove every key in this namespace.
    virtual void clear() = 0;
};

// Build the backend named by config.cache.backend ("sqlite", "json" or
// "memory"), bound to namespace ns. Unknown names fall back to "memory".
std::unique_ptr<KvStore> create_kv_store(const Config& config, const std::string& ns);

} // namespace chatlink
