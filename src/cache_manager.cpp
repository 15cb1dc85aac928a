#include "cache_manager.hpp"
#include "content_reader.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace codescope {

namespace fs = std::filesystem;
using json = nlohmann::json;

json CacheEntry::to_json() const {
    return json{
        {"files", file_map_to_json(files)},
        {"mtimes", mtimes},
        {"root", root},
        {"head", head}
    };
}

CacheEntry CacheEntry::from_json(const json& j) {
    CacheEntry entry;
    if (!j.is_object()) return entry;
    if (j.contains("files")) entry.files = file_map_from_json(j["files"]);
    if (j.contains("mtimes") && j["mtimes"].is_object()) {
        for (auto it = j["mtimes"].begin(); it != j["mtimes"].end(); ++it) {
            if (it.value().is_number()) entry.mtimes[it.key()] = it.value().get<double>();
        }
    }
    entry.root = j.value("root", "");
    entry.head = j.value("head", "");
    return entry;
}

std::string make_fingerprint(const std::string& root, const std::string& head) {
    return sha1_hex(root + head);
}

DiskCacheStore::DiskCacheStore(fs::path cache_dir) : cache_dir_(std::move(cache_dir)) {}

fs::path DiskCacheStore::path_for(const std::string& fingerprint) const {
    return cache_dir_ / ("repo_" + fingerprint + ".json");
}

std::optional<CacheEntry> DiskCacheStore::load(const std::string& fingerprint) {
    fs::path p = path_for(fingerprint);
    std::error_code ec;
    if (!fs::exists(p, ec)) return std::nullopt;

    try {
        std::ifstream f(p);
        if (!f.is_open()) {
            spdlog::warn("Cache file unreadable: {}", p.string());
            return std::nullopt;
        }
        json j = json::parse(f);
        if (!j.is_object()) {
            spdlog::warn("Cache file {} has unexpected shape; ignoring", p.string());
            return std::nullopt;
        }
        auto entry = CacheEntry::from_json(j);
        spdlog::debug("Loaded cache {} ({} records)", p.string(), entry.files.size());
        return entry;
    } catch (const std::exception& e) {
        spdlog::warn("Cache file {} is corrupted, falling back to full scan: {}", p.string(), e.what());
        return std::nullopt;
    }
}

void DiskCacheStore::save(const std::string& fingerprint, const CacheEntry& entry) {
    fs::path p = path_for(fingerprint);
    try {
        fs::create_directories(cache_dir_);
        fs::path tmp = p;
        tmp += ".tmp";
        {
            std::ofstream f(tmp, std::ios::out | std::ios::trunc);
            if (!f.is_open()) {
                spdlog::warn("Cannot write cache file {}", tmp.string());
                return;
            }
            f << entry.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
            if (!f.good()) {
                spdlog::warn("Short write on cache file {}", tmp.string());
                return;
            }
        }
        fs::rename(tmp, p);
        spdlog::debug("Saved cache {} ({} records)", p.string(), entry.files.size());
    } catch (const std::exception& e) {
        spdlog::warn("Cache save failed for {}: {}", p.string(), e.what());
    }
}

} // namespace codescope
