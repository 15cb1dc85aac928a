#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "cache_manager.hpp"
#include "config.hpp"
#include "path_filter.hpp"
#include "repo_snapshot.hpp"
#include "sampling_policy.hpp"
#include "vcs_client.hpp"

namespace codescope {

namespace fs = std::filesystem;

// The only error a scan surfaces to its caller.
class PathNotFoundError : public std::runtime_error {
public:
    explicit PathNotFoundError(const fs::path& path)
        : std::runtime_error("Path not found: " + path.string()), path_(path) {}

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

struct ScanStats {
    size_t candidates = 0;
    size_t reused = 0;        // taken verbatim from the cache
    size_t reprocessed = 0;   // read and classified this run
    size_t discarded = 0;     // reprocessed but excluded (no language, binary, blank)
    size_t sampled_out = 0;   // changed files left out by priority sampling
    bool cache_hit = false;
    double elapsed_ms = 0.0;
};

/**
 * Walks a repository and produces a RepoSnapshot, reusing records from the
 * cache for files whose mtime is unchanged. Only a missing root is an error;
 * per-file, cache and VCS failures degrade to partial results.
 */
class RepoScanner {
public:
    RepoScanner(std::shared_ptr<ICacheStore> cache, std::shared_ptr<IVcsClient> vcs);

    // @throws PathNotFoundError if `root` does not exist.
    std::shared_ptr<const RepoSnapshot> scan(const std::string& root, const ScanOptions& options = {});

    const ScanStats& last_stats() const { return stats_; }

    // Reads, classifies and hashes one file. std::nullopt = excluded.
    static std::optional<FileRecord> process_file(const fs::path& root, const std::string& rel_path, size_t max_bytes);

    static fs::path resolve_root(const std::string& root);

    // Trims `changed` to `remaining` entries with priority sampling.
    // Returns how many were left out.
    static size_t apply_budget(std::vector<CandidateFile>& changed, size_t remaining);

private:
    struct WalkContext {
        const fs::path& root;
        const PathRules& rules;
        bool vcs_ignore;
        size_t max_files;
        std::vector<CandidateFile>& results;
    };

    // Returns false once the candidate budget is full.
    bool recursive_scan(const fs::path& current_dir, const std::string& current_rel, WalkContext& ctx);

    std::shared_ptr<ICacheStore> cache_;
    std::shared_ptr<IVcsClient> vcs_;
    ScanStats stats_;
};

} // namespace codescope
