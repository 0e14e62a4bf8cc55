#pragma once
#include "../kv_store.hpp"

namespace chatlink {

// One JSON-text file per key inside a directory: <dir>/<ns><key>.json.
// Writes go through atomic_write_file.
class FileKvStore : public KvStore {
public:
    FileKvStore(const std::string& dir, const std::string& ns);

    std::string backend_name() const override { return "json"; }

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> keys() override;
    size_t usage_bytes() override;
    void clear() override;

    const std::string& directory() const { return dir_; }

private:
    std::string path_for(const std::string& key) const;

    std::string dir_;
    std::string ns_;
};

} // namespace chatlink
