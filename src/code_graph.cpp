#include "code_graph.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace codescope {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim_left(const std::string& s) {
    size_t pos = s.find_first_not_of(" \t");
    return pos == std::string::npos ? std::string() : s.substr(pos);
}

// "a.b.c" -> "a"; ".x.y" -> "x"; "." -> ""
std::string top_level_module(std::string name) {
    size_t first = name.find_first_not_of('.');
    if (first == std::string::npos) return "";
    name = name.substr(first);
    return name.substr(0, name.find('.'));
}

bool is_module_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

void python_imports(const std::string& line, std::set<std::string>& out) {
    std::string clean = trim_left(line);

    if (clean.rfind("from ", 0) == 0) {
        std::istringstream ss(clean.substr(5));
        std::string module, keyword;
        ss >> module >> keyword;
        if (keyword == "import") {
            std::string top = top_level_module(module);
            if (!top.empty()) out.insert(top);
        }
        return;
    }

    if (clean.rfind("import ", 0) == 0) {
        // import a.b as c, d
        std::stringstream ss(clean.substr(7));
        std::string part;
        while (std::getline(ss, part, ',')) {
            part = trim_left(part);
            size_t end = 0;
            while (end < part.size() && is_module_char(part[end])) ++end;
            std::string top = top_level_module(part.substr(0, end));
            if (!top.empty()) out.insert(top);
        }
    }
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

size_t skip_spaces(const std::string& line, size_t pos) {
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    return pos;
}

// Reads a '...' or "..." literal starting at `pos`. Returns the position past
// the closing quote, or npos when there is no non-empty literal there.
size_t read_quoted(const std::string& line, size_t pos, std::string& value) {
    if (pos >= line.size() || (line[pos] != '\'' && line[pos] != '"')) return std::string::npos;
    size_t close = line.find(line[pos], pos + 1);
    if (close == std::string::npos || close == pos + 1) return std::string::npos;
    value = line.substr(pos + 1, close - pos - 1);
    return close + 1;
}

// Occurrence of `word` at or after `pos` not glued to a preceding identifier.
size_t find_keyword(const std::string& line, const std::string& word, size_t pos) {
    while ((pos = line.find(word, pos)) != std::string::npos) {
        if (pos == 0 || !is_ident_char(line[pos - 1])) return pos;
        pos += word.size();
    }
    return std::string::npos;
}

// import x from '<m>' / import '<m>'. Single forward pass, no backtracking.
void es_imports(const std::string& line, std::set<std::string>& out) {
    size_t pos = 0;
    bool from_left = true;
    while ((pos = find_keyword(line, "import", pos)) != std::string::npos) {
        pos += 6;
        size_t after = skip_spaces(line, pos);
        if (after == pos && after < line.size() && line[after] != '\'' && line[after] != '"') continue;

        std::string module;
        size_t end = read_quoted(line, after, module);
        if (end != std::string::npos) {
            out.insert(module);
            pos = end;
            continue;
        }

        if (!from_left) continue;
        size_t from = after;
        while ((from = find_keyword(line, "from", from)) != std::string::npos) {
            from += 4;
            end = read_quoted(line, skip_spaces(line, from), module);
            if (end != std::string::npos) break;
        }
        if (from == std::string::npos) {
            // No usable `from` clause anywhere after this point.
            from_left = false;
            continue;
        }
        out.insert(module);
        pos = end;
    }
}

void require_calls(const std::string& line, std::set<std::string>& out) {
    size_t pos = 0;
    while ((pos = find_keyword(line, "require", pos)) != std::string::npos) {
        pos += 7;
        if (pos >= line.size() || line[pos] != '(') continue;

        std::string module;
        size_t end = read_quoted(line, skip_spaces(line, pos + 1), module);
        if (end == std::string::npos) continue;
        end = skip_spaces(line, end);
        if (end < line.size() && line[end] == ')') {
            out.insert(module);
            pos = end + 1;
        }
    }
}

void js_imports(const std::string& line, std::set<std::string>& out) {
    if (line.find("import") != std::string::npos) es_imports(line, out);
    if (line.find("require") != std::string::npos) require_calls(line, out);
}

} // namespace

std::set<std::string> extract_imports(Language lang, const std::string& text) {
    std::set<std::string> imports;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (lang == Language::Python) {
            python_imports(line, imports);
        } else {
            js_imports(line, imports);
        }
    }
    return imports;
}

CodeGraph CodeGraph::build(const RepoSnapshot& snapshot) {
    CodeGraph graph;

    std::unordered_map<std::string, std::vector<std::string>> by_stem;
    for (const auto& [path, rec] : snapshot.files) {
        by_stem[fs::path(path).stem().string()].push_back(path);
        graph.edges_[path];
    }

    for (const auto& [path, rec] : snapshot.files) {
        if (!rec.language) continue;
        auto imports = extract_imports(*rec.language, rec.text);
        auto& deps = graph.edges_[path];

        if (*rec.language == Language::Python) {
            for (const auto& module : imports) {
                auto it = by_stem.find(module);
                if (it == by_stem.end()) continue;
                for (const auto& other : it->second) {
                    if (other != path) deps.insert(other);
                }
            }
            continue;
        }

        for (const auto& specifier : imports) {
            // Package imports are external.
            if (specifier.rfind("./", 0) != 0 && specifier.rfind("../", 0) != 0) continue;
            std::string target = (fs::path(path).parent_path() / specifier).lexically_normal().generic_string();
            for (const auto& [other, other_rec] : snapshot.files) {
                if (other != path && other.rfind(target, 0) == 0) deps.insert(other);
            }
        }
    }

    spdlog::debug("Dependency graph: {} nodes, {} edges", graph.node_count(), graph.edge_count());
    return graph;
}

const std::set<std::string>& CodeGraph::dependencies_of(const std::string& path) const {
    static const std::set<std::string> none;
    auto it = edges_.find(path);
    return it == edges_.end() ? none : it->second;
}

std::vector<std::string> CodeGraph::dependents_of(const std::string& path) const {
    std::vector<std::string> out;
    for (const auto& [src, deps] : edges_) {
        if (deps.count(path)) out.push_back(src);
    }
    return out;
}

size_t CodeGraph::edge_count() const {
    size_t n = 0;
    for (const auto& [src, deps] : edges_) n += deps.size();
    return n;
}

std::vector<Hotspot> CodeGraph::hotspots(const RepoSnapshot& snapshot) const {
    std::vector<Hotspot> ranked;
    if (snapshot.files.empty()) return ranked;

    std::map<std::string, int> in_degree;
    for (const auto& [src, deps] : edges_) {
        for (const auto& dst : deps) in_degree[dst]++;
    }

    double max_churn = 0.0, max_sloc = 0.0, max_degree = 0.0;
    struct Raw { double churn, sloc, degree; };
    std::vector<Raw> raw;
    raw.reserve(snapshot.files.size());
    for (const auto& [path, rec] : snapshot.files) {
        auto churn = snapshot.vcs.churn_by_file.find(path);
        auto in = in_degree.find(path);
        Raw r{
            churn == snapshot.vcs.churn_by_file.end() ? 0.0 : static_cast<double>(churn->second),
            static_cast<double>(rec.sloc),
            static_cast<double>(dependencies_of(path).size() + (in == in_degree.end() ? 0 : in->second))
        };
        max_churn = std::max(max_churn, r.churn);
        max_sloc = std::max(max_sloc, r.sloc);
        max_degree = std::max(max_degree, r.degree);
        raw.push_back(r);
    }

    auto norm = [](double v, double max_v) { return max_v > 0.0 ? v / max_v : 0.0; };
    size_t i = 0;
    for (const auto& [path, rec] : snapshot.files) {
        const Raw& r = raw[i++];
        double score = 0.5 * norm(r.churn, max_churn) + 0.3 * norm(r.sloc, max_sloc) + 0.2 * norm(r.degree, max_degree);
        ranked.push_back({path, score});
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const Hotspot& a, const Hotspot& b) {
        return a.score > b.score;
    });
    return ranked;
}

json CodeGraph::to_json() const {
    json nodes = json::array();
    json links = json::array();
    for (const auto& [src, deps] : edges_) {
        nodes.push_back(src);
        for (const auto& dst : deps) links.push_back({{"source", src}, {"target", dst}});
    }
    return json{{"nodes", nodes}, {"edges", links}};
}

} // namespace codescope
