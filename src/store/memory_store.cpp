#include "memory_store.hpp"

namespace chatlink {

std::optional<std::string> MemoryKvStore::get(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void MemoryKvStore::put(const std::string& key, const std::string& value) {
    size_t existing = 0;
    auto it = entries_.find(key);
    if (it != entries_.end()) existing = it->first.size() + it->second.size();

    size_t next_usage = usage_ - existing + key.size() + value.size();
    if (capacity_ > 0 && next_usage > capacity_) {
        throw StorageQuotaError("memory store full: " + std::to_string(next_usage) +
                                " > " + std::to_string(capacity_) + " bytes");
    }
    entries_[key] = value;
    usage_ = next_usage;
    ++put_count_;
}

bool MemoryKvStore::remove(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    usage_ -= it->first.size() + it->second.size();
    entries_.erase(it);
    return true;
}

std::vector<std::string> MemoryKvStore::keys() {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [key, value] : entries_) out.push_back(key);
    return out;
}

void MemoryKvStore::clear() {
    entries_.clear();
    usage_ = 0;
}

} // namespace chatlink
