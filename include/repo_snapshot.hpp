#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "language.hpp"

namespace codescope {

struct FileRecord {
    std::string path;                 // repo-relative, '/' separated
    std::optional<Language> language;
    std::string text;                 // valid UTF-8
    size_t sloc = 0;
    std::string content_hash;         // hex sha256 of text

    nlohmann::json to_json() const;
    static FileRecord from_json(const nlohmann::json& j);

    bool operator==(const FileRecord& other) const;
};

using FileMap = std::map<std::string, FileRecord>;

struct VcsStats {
    bool is_repo = false;
    std::map<std::string, int> churn_by_file;
    // 0 means unknown
    std::map<std::string, int64_t> last_modified_by_file;
};

struct SnapshotSummary {
    size_t file_count = 0;
    size_t sloc_total = 0;
};

/**
 * Point-in-time result of one ingestion run. Scanners hand it out as
 * shared_ptr<const RepoSnapshot>; consumers that need a modified view copy it.
 */
struct RepoSnapshot {
    std::string root;
    FileMap files;
    std::vector<Language> languages;
    VcsStats vcs;
    SnapshotSummary summary;

    // Recomputes languages and summary from files.
    void refresh_derived();

    nlohmann::json summary_json() const;
};

nlohmann::json file_map_to_json(const FileMap& files);
FileMap file_map_from_json(const nlohmann::json& j);

} // namespace codescope
