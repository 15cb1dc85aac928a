#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

namespace codescope {

enum PathFlag : uint8_t {
    NONE = 0,
    IGNORE = 1 << 0,
    INCLUDE = 1 << 1  // overrides IGNORE
};

// Path-segment trie for prefix rules ("vendor/" ignores everything below it).
class PrefixTrie {
    struct Node {
        std::unordered_map<std::string, std::unique_ptr<Node>> children;
        uint8_t flags = PathFlag::NONE;
    };

    std::unique_ptr<Node> root;

public:
    PrefixTrie() : root(std::make_unique<Node>()) {}

    // O(L) insertion
    void insert(const std::string& path, PathFlag flag) {
        Node* current = root.get();
        for (const auto& part : std::filesystem::path(path).lexically_normal()) {
            std::string segment = part.generic_string();
            if (segment == "." || segment.empty()) continue;

            auto& child = current->children[segment];
            if (!child) child = std::make_unique<Node>();
            current = child.get();
        }
        if (current != root.get()) current->flags |= flag;
    }

    // Flags of the deepest rule that is a prefix of `path`.
    uint8_t check(const std::filesystem::path& path) const {
        const Node* current = root.get();
        uint8_t accumulated_flags = PathFlag::NONE;

        for (const auto& part : path) {
            auto it = current->children.find(part.generic_string());
            if (it == current->children.end()) break;
            current = it->second.get();
            if (current->flags != PathFlag::NONE) accumulated_flags = current->flags;
        }
        return accumulated_flags;
    }

    // True when some rule carrying `flag` lies strictly below `path`.
    bool has_descendant_with(const std::filesystem::path& path, PathFlag flag) const {
        const Node* current = root.get();
        for (const auto& part : path) {
            auto it = current->children.find(part.generic_string());
            if (it == current->children.end()) return false;
            current = it->second.get();
        }
        return subtree_has(current, flag, true);
    }

    bool empty() const { return root->children.empty(); }

    void clear() {
        root = std::make_unique<Node>();
    }

private:
    static bool subtree_has(const Node* node, PathFlag flag, bool skip_self) {
        if (!skip_self && (node->flags & flag)) return true;
        for (const auto& [name, child] : node->children) {
            if (subtree_has(child.get(), flag, false)) return true;
        }
        return false;
    }
};

} // namespace codescope
