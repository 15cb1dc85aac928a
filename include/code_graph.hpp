#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "language.hpp"
#include "repo_snapshot.hpp"

namespace codescope {

/**
 * Best-effort import scanning, line by line, no grammar.
 * Python: top-level package of `import a.b` / `from a.b import c`
 * (relative `from .x import` yields "x"). JS/TS: module specifiers of
 * `import ... from '<m>'`, `import '<m>'` and `require('<m>')`.
 */
std::set<std::string> extract_imports(Language lang, const std::string& text);

struct Hotspot {
    std::string path;
    double score = 0.0;
};

// File-level graph: path -> paths it imports. Every snapshot file is a node.
class CodeGraph {
public:
    static CodeGraph build(const RepoSnapshot& snapshot);

    const std::map<std::string, std::set<std::string>>& edges() const { return edges_; }
    const std::set<std::string>& dependencies_of(const std::string& path) const;
    std::vector<std::string> dependents_of(const std::string& path) const;
    size_t node_count() const { return edges_.size(); }
    size_t edge_count() const;

    /**
     * Files ranked by 0.5 * churn + 0.3 * SLOC + 0.2 * (in + out degree),
     * each term divided by its maximum over the snapshot (all-zero terms
     * contribute nothing). Highest first; ties keep path order.
     */
    std::vector<Hotspot> hotspots(const RepoSnapshot& snapshot) const;

    nlohmann::json to_json() const;

private:
    std::map<std::string, std::set<std::string>> edges_;
};

} // namespace codescope
