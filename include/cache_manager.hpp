#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "repo_snapshot.hpp"

namespace codescope {

constexpr const char* NO_VCS_HEAD = "nogit";

// Persisted result of a previous scan of one (root, HEAD) pair.
struct CacheEntry {
    FileMap files;
    std::map<std::string, double> mtimes;  // seconds since epoch
    std::string root;
    std::string head;

    nlohmann::json to_json() const;
    static CacheEntry from_json(const nlohmann::json& j);
};

// Hex SHA-1 of root + head. Moving the repo or switching branch yields a new key.
std::string make_fingerprint(const std::string& root, const std::string& head);

class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    // std::nullopt when absent or unreadable. Never throws.
    virtual std::optional<CacheEntry> load(const std::string& fingerprint) = 0;
    // Failures are logged and swallowed.
    virtual void save(const std::string& fingerprint, const CacheEntry& entry) = 0;
};

// One JSON file per fingerprint: <cache_dir>/repo_<fingerprint>.json
class DiskCacheStore : public ICacheStore {
public:
    explicit DiskCacheStore(std::filesystem::path cache_dir);

    std::optional<CacheEntry> load(const std::string& fingerprint) override;
    void save(const std::string& fingerprint, const CacheEntry& entry) override;

    std::filesystem::path path_for(const std::string& fingerprint) const;
    const std::filesystem::path& directory() const { return cache_dir_; }

private:
    std::filesystem::path cache_dir_;
};

class MemoryCacheStore : public ICacheStore {
public:
    std::optional<CacheEntry> load(const std::string& fingerprint) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(fingerprint);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    void save(const std::string& fingerprint, const CacheEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[fingerprint] = entry;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    std::unordered_map<std::string, CacheEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace codescope
