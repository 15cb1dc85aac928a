#pragma once
#include <string>
#include <unordered_set>
#include <vector>
#include "PrefixTrie.hpp"

namespace codescope {

// Directory names never descended into (VCS metadata, dependencies, build output, virtualenvs).
const std::unordered_set<std::string>& ignored_dir_names();
bool is_ignored_dir_name(const std::string& name);

/**
 * Project-level path rules from configuration. `ignored` entries prune a
 * subtree; `included` entries are exceptions that re-enable a path below an
 * ignored prefix, together with the directories leading to it.
 */
class PathRules {
public:
    PathRules() = default;
    PathRules(const std::vector<std::string>& ignored, const std::vector<std::string>& included);

    bool should_enter_dir(const std::string& rel_path) const;
    bool should_collect_file(const std::string& rel_path) const;

    bool empty() const { return trie_.empty(); }

private:
    PrefixTrie trie_;
};

} // namespace codescope
