#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "repo_snapshot.hpp"

namespace codescope {

constexpr size_t DEFAULT_LINES_PER_CHUNK = 120;

// A fixed-size line window of one file: the unit that gets indexed.
struct Chunk {
    std::string path;
    size_t start_line = 1;   // 1-based, inclusive
    size_t end_line = 1;     // inclusive
    std::string text;
    std::vector<std::string> functions;  // lowercase definition names in order

    nlohmann::json to_json() const;
    static Chunk from_json(const nlohmann::json& j);
};

using SparseVector = std::unordered_map<std::string, double>;

struct SearchHit {
    std::shared_ptr<const Chunk> chunk;
    double score = 0.0;
};

// Lowercased identifiers: [A-Za-z_][A-Za-z0-9_]+
std::vector<std::string> tokenize(const std::string& text);

// Names matched by `def name`, `function name` or `const name =`, lowercased.
std::vector<std::string> extract_functions(const std::string& text);

// Splits on '\n' (a trailing '\r' is dropped) into windows of lines_per lines.
std::vector<Chunk> chunk_file(const std::string& path, const std::string& text, size_t lines_per = DEFAULT_LINES_PER_CHUNK);

/**
 * TF-IDF model over chunks.
 *
 * Each chunk's terms are its tokens plus its function names and the file
 * stem. idf(t) = log((1 + N) / (1 + df(t))) + 1, terms unseen at query time
 * weigh 1.0. Document and query vectors are (count / total) * idf, L2
 * normalized, so search scores are cosine similarities.
 *
 * add_documents() recomputes idf and every document vector over the whole
 * corpus, so adding in several batches gives the same model as one bulk add.
 */
class LexicalIndex {
public:
    void add_documents(std::vector<Chunk> chunks);

    // Ranked by score, descending; stable for ties. At most top_k hits.
    std::vector<SearchHit> search(const std::string& query, size_t top_k = 5) const;

    SparseVector vectorize_query(const std::string& query) const;
    double idf(const std::string& term) const;

    size_t size() const { return documents_.size(); }
    bool empty() const { return documents_.empty(); }

    const std::vector<std::shared_ptr<const Chunk>>& documents() const { return documents_; }
    const std::vector<SparseVector>& document_vectors() const { return document_vectors_; }
    const std::unordered_map<std::string, double>& vocabulary_idf() const { return vocabulary_idf_; }

    nlohmann::json to_json() const;
    static std::optional<LexicalIndex> from_json(const nlohmann::json& j);

    bool save(const std::filesystem::path& path) const;
    static std::optional<LexicalIndex> load(const std::filesystem::path& path);

private:
    using TermCounts = std::unordered_map<std::string, int>;

    static TermCounts count_terms(const Chunk& chunk);
    SparseVector weigh(const TermCounts& counts) const;
    void rebuild();

    std::vector<std::shared_ptr<const Chunk>> documents_;
    std::vector<TermCounts> term_counts_;
    std::unordered_map<std::string, double> vocabulary_idf_;
    std::vector<SparseVector> document_vectors_;
};

// Chunks at most options.max_files files (in path order) and indexes them.
LexicalIndex build_index(const RepoSnapshot& snapshot, const IndexOptions& options = {});

// First 16 hex chars of sha256(root + path + hash ...) in path order.
std::string index_cache_key(const RepoSnapshot& snapshot);

} // namespace codescope
