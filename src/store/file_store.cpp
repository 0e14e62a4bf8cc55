#include "file_store.hpp"
#include "../util.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace chatlink {

namespace fs = std::filesystem;

static constexpr const char* kSuffix = ".json";

static std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

FileKvStore::FileKvStore(const std::string& dir, const std::string& ns)
    : dir_(dir), ns_(ns) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw std::runtime_error("FileKvStore: cannot create " + dir_ + ": " + ec.message());
}

std::string FileKvStore::path_for(const std::string& key) const {
    return (fs::path(dir_) / (ns_ + url_encode(key) + kSuffix)).string();
}

std::optional<std::string> FileKvStore::get(const std::string& key) {
    std::ifstream file(path_for(key), std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void FileKvStore::put(const std::string& key, const std::string& value) {
    if (atomic_write_file(path_for(key), value)) return;

    std::error_code ec;
    auto space = fs::space(dir_, ec);
    if (!ec && space.available < value.size() + 4096) {
        throw StorageQuotaError("FileKvStore: no space left in " + dir_);
    }
    throw std::runtime_error("FileKvStore: failed to write " + path_for(key));
}

bool FileKvStore::remove(const std::string& key) {
    std::error_code ec;
    return fs::remove(path_for(key), ec);
}

std::vector<std::string> FileKvStore::keys() {
    std::vector<std::string> out;
    std::error_code ec;
    std::string suffix = kSuffix;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (name.size() <= ns_.size() + suffix.size()) continue;
        if (name.compare(0, ns_.size(), ns_) != 0) continue;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;
        out.push_back(percent_decode(
            name.substr(ns_.size(), name.size() - ns_.size() - suffix.size())));
    }
    return out;
}

size_t FileKvStore::usage_bytes() {
    size_t total = 0;
    std::error_code ec;
    for (const auto& key : keys()) {
        auto size = fs::file_size(path_for(key), ec);
        if (!ec) total += key.size() + static_cast<size_t>(size);
    }
    return total;
}

void FileKvStore::clear() {
    for (const auto& key : keys()) remove(key);
}

} // namespace chatlink
