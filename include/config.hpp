#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "content_reader.hpp"

namespace codescope {

namespace fs = std::filesystem;

struct ScanOptions {
    size_t max_files = 2000;
    size_t max_bytes_per_file = MAX_BYTES_PER_FILE_DEFAULT;
    bool incremental = true;
    size_t workers = 0;                       // 0 = min(32, 2 x cores)
    std::vector<std::string> ignored_paths;   // project-relative prefixes
    std::vector<std::string> included_paths;  // exceptions under ignored prefixes
};

struct IndexOptions {
    size_t max_files = 1000;
    size_t lines_per_chunk = 120;
    size_t top_k = 5;
};

struct EngineConfig {
    ScanOptions scan;
    IndexOptions index;
    std::optional<fs::path> cache_dir;
    int vcs_query_timeout_seconds = 5;
    int vcs_history_timeout_seconds = 10;
    std::string log_level = "info";

    // Missing keys keep their defaults.
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * Looks for <root>/.codescope/config.json, then <root>/codescope.json,
     * unless `explicit_path` is given. A missing file yields defaults; a
     * corrupted one is logged and also yields defaults.
     */
    static EngineConfig load(const fs::path& root, const std::optional<fs::path>& explicit_path = std::nullopt);
};

// $CODESCOPE_CACHE_DIR, else $XDG_CACHE_HOME/codescope, else ~/.cache/codescope.
fs::path default_cache_dir();

} // namespace codescope
