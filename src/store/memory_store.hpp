#pragma once
#include "../kv_store.hpp"
#include <map>

namespace chatlink {

// Process-memory backend. capacity_bytes == 0 means unbounded.
class MemoryKvStore : public KvStore {
public:
    explicit MemoryKvStore(size_t capacity_bytes = 0) : capacity_(capacity_bytes) {}

    std::string backend_name() const override { return "memory"; }

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> keys() override;
    size_t usage_bytes() override { return usage_; }
    void clear() override;

    void set_capacity(size_t capacity_bytes) { capacity_ = capacity_bytes; }
    size_t put_count() const { return put_count_; }

private:
    std::map<std::string, std::string> entries_;
    size_t capacity_;
    size_t usage_ = 0;
    size_t put_count_ = 0;
};

} // namespace chatlink
