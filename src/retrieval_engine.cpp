#include "retrieval_engine.hpp"
#include "content_reader.hpp"
#include <cctype>
#include <chrono>
#include <spdlog/spdlog.h>

namespace codescope {

namespace fs = std::filesystem;

RetrievalEngine::RetrievalEngine(std::optional<fs::path> index_cache_dir, IndexOptions options)
    : index_cache_dir_(std::move(index_cache_dir)), options_(options) {}

std::optional<fs::path> RetrievalEngine::index_path_for(const RepoSnapshot& snapshot) const {
    if (!index_cache_dir_) return std::nullopt;
    // Chunking options are part of the name so a config change never reuses a stale model.
    std::string name = "tfidf_" + index_cache_key(snapshot) + "_" +
                       std::to_string(options_.lines_per_chunk) + "x" + std::to_string(options_.max_files) + ".json";
    return *index_cache_dir_ / name;
}

std::shared_ptr<const LexicalIndex> RetrievalEngine::prepare(const RepoSnapshot& snapshot) {
    auto start = std::chrono::steady_clock::now();
    loaded_from_cache_ = false;
    index_.reset();

    auto path = index_path_for(snapshot);
    if (path) {
        if (auto cached = LexicalIndex::load(*path)) {
            index_ = std::make_shared<const LexicalIndex>(std::move(*cached));
            loaded_from_cache_ = true;
        }
    }

    if (!index_) {
        index_ = std::make_shared<const LexicalIndex>(build_index(snapshot, options_));
        if (path && !index_->save(*path)) {
            spdlog::warn("Index not persisted; next run rebuilds it");
        }
    }

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("Index ready: {} chunks ({}) in {:.2f} ms",
                 index_->size(), loaded_from_cache_ ? "cached" : "built", duration);
    return index_;
}

std::vector<SearchHit> RetrievalEngine::retrieve(const std::string& query, std::optional<size_t> top_k) const {
    if (!index_) return {};

    auto start = std::chrono::steady_clock::now();
    auto hits = index_->search(query, top_k.value_or(options_.top_k));
    last_latency_ms_ = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    spdlog::debug("⏱️ Retrieval time: {:.2f} ms ({} hits)", last_latency_ms_, hits.size());
    return hits;
}

std::string make_preview(const std::string& text, size_t max_chars) {
    std::string collapsed;
    collapsed.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space) {
            collapsed += ' ';
            pending_space = false;
        }
        collapsed += c;
    }
    return utf8_safe_substr(collapsed, max_chars);
}

} // namespace codescope
