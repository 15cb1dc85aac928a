#include "path_filter.hpp"
#include <filesystem>

namespace codescope {

namespace fs = std::filesystem;

const std::unordered_set<std::string>& ignored_dir_names() {
    static const std::unordered_set<std::string> names = {
        ".git", ".hg", ".svn",
        "node_modules", "dist", "build", "out",
        "__pycache__", ".venv", "venv",
    };
    return names;
}

bool is_ignored_dir_name(const std::string& name) {
    return ignored_dir_names().count(name) > 0;
}

PathRules::PathRules(const std::vector<std::string>& ignored, const std::vector<std::string>& included) {
    for (const auto& p : ignored) {
        if (!p.empty()) trie_.insert(p, PathFlag::IGNORE);
    }
    for (const auto& p : included) {
        if (!p.empty()) trie_.insert(p, PathFlag::INCLUDE);
    }
}

bool PathRules::should_enter_dir(const std::string& rel_path) const {
    if (trie_.empty()) return true;
    fs::path rel(rel_path);
    uint8_t flags = trie_.check(rel);
    if (flags & PathFlag::INCLUDE) return true;
    if (!(flags & PathFlag::IGNORE)) return true;
    return trie_.has_descendant_with(rel, PathFlag::INCLUDE);
}

bool PathRules::should_collect_file(const std::string& rel_path) const {
    if (trie_.empty()) return true;
    uint8_t flags = trie_.check(fs::path(rel_path));
    return (flags & PathFlag::INCLUDE) || !(flags & PathFlag::IGNORE);
}

} // namespace codescope
