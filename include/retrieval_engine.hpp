#pragma once
#include "lexical_index.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codescope {

/**
 * Serves ranked chunks for a snapshot. When a cache directory is configured
 * the index is persisted there, keyed by the snapshot's content, and reused
 * as long as no file changed.
 */
class RetrievalEngine {
public:
    explicit RetrievalEngine(std::optional<std::filesystem::path> index_cache_dir = std::nullopt,
                             IndexOptions options = {});

    // Loads the persisted index for this snapshot, or builds and persists one.
    std::shared_ptr<const LexicalIndex> prepare(const RepoSnapshot& snapshot);

    // Empty until prepare() has run.
    std::vector<SearchHit> retrieve(const std::string& query, std::optional<size_t> top_k = std::nullopt) const;

    bool loaded_from_cache() const { return loaded_from_cache_; }
    double last_latency_ms() const { return last_latency_ms_; }

    std::optional<std::filesystem::path> index_path_for(const RepoSnapshot& snapshot) const;

private:
    std::optional<std::filesystem::path> index_cache_dir_;
    IndexOptions options_;
    std::shared_ptr<const LexicalIndex> index_;
    bool loaded_from_cache_ = false;
    mutable double last_latency_ms_ = 0.0;
};

// Whitespace runs collapsed to one space, cut to max_chars code points.
std::string make_preview(const std::string& text, size_t max_chars = 200);

} // namespace codescope
