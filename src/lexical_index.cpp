#include "lexical_index.hpp"
#include "content_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

namespace codescope {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool is_ident_char(unsigned char c) { return std::isalnum(c) || c == '_'; }
bool is_ident_start(unsigned char c) { return std::isalpha(c) || c == '_'; }

bool is_space(unsigned char c) { return std::isspace(c) != 0; }

// Matches `keyword\s+identifier` at `pos`; for `const` the identifier must be
// followed by `\s*=`. Returns the end of the match, or npos.
size_t match_definition(const std::string& text, size_t pos, std::string& name) {
    static const std::string keywords[] = {"def", "function", "const"};
    for (const auto& kw : keywords) {
        if (text.compare(pos, kw.size(), kw) != 0) continue;

        size_t i = pos + kw.size();
        size_t ws = i;
        while (i < text.size() && is_space(static_cast<unsigned char>(text[i]))) ++i;
        if (i == ws || i >= text.size() || !is_ident_start(static_cast<unsigned char>(text[i]))) continue;

        size_t ident = i;
        while (i < text.size() && is_ident_char(static_cast<unsigned char>(text[i]))) ++i;
        if (kw == "const") {
            size_t eq = i;
            while (eq < text.size() && is_space(static_cast<unsigned char>(text[eq]))) ++eq;
            if (eq >= text.size() || text[eq] != '=') continue;
            name = text.substr(ident, i - ident);
            return eq + 1;
        }
        name = text.substr(ident, i - ident);
        return i;
    }
    return std::string::npos;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

json Chunk::to_json() const {
    return json{
        {"path", path},
        {"start", start_line},
        {"end", end_line},
        {"text", text},
        {"functions", functions}
    };
}

Chunk Chunk::from_json(const json& j) {
    Chunk c;
    c.path = j.value("path", "");
    c.start_line = j.value("start", static_cast<size_t>(1));
    c.end_line = j.value("end", static_cast<size_t>(1));
    c.text = j.value("text", "");
    c.functions = j.value("functions", std::vector<std::string>{});
    return c;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        if (!is_ident_char(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        // Maximal identifier run; leading digits can't start a token.
        size_t run_end = i;
        while (run_end < n && is_ident_char(static_cast<unsigned char>(text[run_end]))) ++run_end;
        size_t start = i;
        while (start < run_end && !is_ident_start(static_cast<unsigned char>(text[start]))) ++start;
        if (run_end - start >= 2) tokens.push_back(to_lower(text.substr(start, run_end - start)));
        i = run_end;
    }
    return tokens;
}

std::vector<std::string> extract_functions(const std::string& text) {
    std::vector<std::string> functions;
    size_t pos = 0;
    std::string name;
    while (pos < text.size()) {
        size_t end = match_definition(text, pos, name);
        if (end == std::string::npos) {
            ++pos;
            continue;
        }
        functions.push_back(to_lower(name));
        pos = end;
    }
    return functions;
}

std::vector<Chunk> chunk_file(const std::string& path, const std::string& text, size_t lines_per) {
    if (lines_per == 0) lines_per = DEFAULT_LINES_PER_CHUNK;

    const std::vector<std::string_view> lines = split_lines(text);

    std::vector<Chunk> chunks;
    for (size_t i = 0; i < lines.size(); i += lines_per) {
        const size_t end = std::min(i + lines_per, lines.size());
        Chunk c;
        c.path = path;
        c.start_line = i + 1;
        c.end_line = end;
        for (size_t k = i; k < end; ++k) {
            if (k > i) c.text += '\n';
            c.text += lines[k];
        }
        c.functions = extract_functions(c.text);
        chunks.push_back(std::move(c));
    }
    return chunks;
}

LexicalIndex::TermCounts LexicalIndex::count_terms(const Chunk& chunk) {
    TermCounts counts;
    for (auto& tok : tokenize(chunk.text)) counts[tok]++;
    // Boost tokens: definition names and the file stem.
    for (const auto& fn : chunk.functions) counts[to_lower(fn)]++;
    counts[to_lower(fs::path(chunk.path).stem().string())]++;
    return counts;
}

double LexicalIndex::idf(const std::string& term) const {
    auto it = vocabulary_idf_.find(term);
    return it == vocabulary_idf_.end() ? 1.0 : it->second;
}

SparseVector LexicalIndex::weigh(const TermCounts& counts) const {
    int total = 0;
    for (const auto& [tok, cnt] : counts) total += cnt;
    const double denom = static_cast<double>(std::max(1, total));

    SparseVector vec;
    vec.reserve(counts.size());
    double norm = 0.0;
    for (const auto& [tok, cnt] : counts) {
        double w = (static_cast<double>(cnt) / denom) * idf(tok);
        vec[tok] = w;
        norm += w * w;
    }
    norm = std::sqrt(norm);
    if (norm == 0.0) norm = 1.0;
    for (auto& [tok, w] : vec) w /= norm;
    return vec;
}

void LexicalIndex::add_documents(std::vector<Chunk> chunks) {
    const size_t first_new = documents_.size();
    documents_.reserve(first_new + chunks.size());
    for (auto& c : chunks) documents_.push_back(std::make_shared<const Chunk>(std::move(c)));

    term_counts_.resize(documents_.size());
    const long long total = static_cast<long long>(documents_.size());
    #pragma omp parallel for schedule(dynamic, 16)
    for (long long i = static_cast<long long>(first_new); i < total; ++i) {
        term_counts_[i] = count_terms(*documents_[i]);
    }

    rebuild();
}

void LexicalIndex::rebuild() {
    std::unordered_map<std::string, int> df;
    for (const auto& counts : term_counts_) {
        for (const auto& [tok, cnt] : counts) df[tok]++;
    }

    const double n_docs = static_cast<double>(documents_.size());
    vocabulary_idf_.clear();
    vocabulary_idf_.reserve(df.size());
    for (const auto& [tok, c] : df) {
        vocabulary_idf_[tok] = std::log((1.0 + n_docs) / (1.0 + c)) + 1.0;
    }

    document_vectors_.assign(documents_.size(), SparseVector{});
    const long long total = static_cast<long long>(documents_.size());
    #pragma omp parallel for schedule(dynamic, 16)
    for (long long i = 0; i < total; ++i) {
        document_vectors_[i] = weigh(term_counts_[i]);
    }
}

SparseVector LexicalIndex::vectorize_query(const std::string& query) const {
    TermCounts counts;
    for (auto& tok : tokenize(query)) counts[tok]++;
    // Definition names spelled out in the query count double.
    for (auto& fn : extract_functions(query)) counts[fn] += 2;
    return weigh(counts);
}

std::vector<SearchHit> LexicalIndex::search(const std::string& query, size_t top_k) const {
    const SparseVector q = vectorize_query(query);

    std::vector<std::pair<size_t, double>> scored;
    scored.reserve(document_vectors_.size());
    for (size_t idx = 0; idx < document_vectors_.size(); ++idx) {
        const auto& d = document_vectors_[idx];
        double s = 0.0;
        for (const auto& [tok, wq] : q) {
            auto it = d.find(tok);
            if (it != d.end()) s += wq * it->second;
        }
        scored.emplace_back(idx, s);
    }

    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    if (scored.size() > top_k) scored.resize(top_k);

    std::vector<SearchHit> hits;
    hits.reserve(scored.size());
    for (const auto& [idx, score] : scored) hits.push_back({documents_[idx], score});
    return hits;
}

json LexicalIndex::to_json() const {
    json docs = json::array();
    for (const auto& d : documents_) docs.push_back(d->to_json());
    return json{
        {"docs", docs},
        {"vocab_idf", vocabulary_idf_},
        {"doc_tfs", document_vectors_}
    };
}

std::optional<LexicalIndex> LexicalIndex::from_json(const json& j) {
    try {
        LexicalIndex index;
        for (const auto& jd : j.at("docs")) {
            index.documents_.push_back(std::make_shared<const Chunk>(Chunk::from_json(jd)));
        }
        index.vocabulary_idf_ = j.at("vocab_idf").get<std::unordered_map<std::string, double>>();
        index.document_vectors_ = j.at("doc_tfs").get<std::vector<SparseVector>>();
        if (index.document_vectors_.size() != index.documents_.size()) {
            spdlog::warn("Index payload has {} vectors for {} documents", index.document_vectors_.size(), index.documents_.size());
            return std::nullopt;
        }
        // Raw counts are not persisted; recover them so later additions can rebuild.
        index.term_counts_.reserve(index.documents_.size());
        for (const auto& d : index.documents_) index.term_counts_.push_back(count_terms(*d));
        return index;
    } catch (const std::exception& e) {
        spdlog::warn("Malformed index payload: {}", e.what());
        return std::nullopt;
    }
}

bool LexicalIndex::save(const fs::path& path) const {
    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) {
            spdlog::warn("Cannot write index file {}", path.string());
            return false;
        }
        f << to_json().dump(-1, ' ', false, json::error_handler_t::replace);
        return f.good();
    } catch (const std::exception& e) {
        spdlog::warn("Index save failed for {}: {}", path.string(), e.what());
        return false;
    }
}

std::optional<LexicalIndex> LexicalIndex::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;
    try {
        std::ifstream f(path);
        return from_json(json::parse(f));
    } catch (const std::exception& e) {
        spdlog::warn("Index file {} unreadable: {}", path.string(), e.what());
        return std::nullopt;
    }
}

LexicalIndex build_index(const RepoSnapshot& snapshot, const IndexOptions& options) {
    std::vector<Chunk> docs;
    size_t files = 0;
    for (const auto& [rel_path, rec] : snapshot.files) {
        if (files >= options.max_files) break;
        files++;
        auto chunks = chunk_file(rel_path, rec.text, options.lines_per_chunk);
        std::move(chunks.begin(), chunks.end(), std::back_inserter(docs));
    }

    LexicalIndex index;
    index.add_documents(std::move(docs));
    spdlog::info("Indexed {} chunks from {} files ({} terms)", index.size(), files, index.vocabulary_idf().size());
    return index;
}

std::string index_cache_key(const RepoSnapshot& snapshot) {
    std::string material = snapshot.root;
    for (const auto& [path, rec] : snapshot.files) {
        material += path;
        material += rec.content_hash;
    }
    return sha256_hex(material).substr(0, 16);
}

} // namespace codescope
