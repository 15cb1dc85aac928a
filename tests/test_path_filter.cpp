#include <gtest/gtest.h>
#include "path_filter.hpp"

using namespace codescope;

TEST(PathFilterTest, DenyListedDirectoryNames) {
    for (const char* name : {".git", "node_modules", "__pycache__", ".venv", "venv", "dist", "build", "out"}) {
        EXPECT_TRUE(is_ignored_dir_name(name)) << name;
    }
    EXPECT_FALSE(is_ignored_dir_name("src"));
    EXPECT_FALSE(is_ignored_dir_name("builder"));
}

TEST(PathFilterTest, EmptyRulesAllowEverything) {
    PathRules rules;
    EXPECT_TRUE(rules.empty());
    EXPECT_TRUE(rules.should_enter_dir("anything/below"));
    EXPECT_TRUE(rules.should_collect_file("anything/below/x.py"));
}

TEST(PathFilterTest, IgnoredPrefixPrunesSubtree) {
    PathRules rules({"vendor", "docs/generated"}, {});
    EXPECT_FALSE(rules.should_enter_dir("vendor"));
    EXPECT_FALSE(rules.should_collect_file("vendor/lib/x.js"));
    EXPECT_TRUE(rules.should_enter_dir("docs"));
    EXPECT_FALSE(rules.should_enter_dir("docs/generated"));
    EXPECT_TRUE(rules.should_collect_file("docs/conf.py"));
    EXPECT_TRUE(rules.should_collect_file("vendored.py"));
}

TEST(PathFilterTest, IncludedPathReopensIgnoredPrefix) {
    PathRules rules({"third"}, {"third/keep"});
    EXPECT_TRUE(rules.should_enter_dir("third"));
    EXPECT_TRUE(rules.should_enter_dir("third/keep"));
    EXPECT_TRUE(rules.should_collect_file("third/keep/mod.py"));
    EXPECT_FALSE(rules.should_enter_dir("third/drop"));
    EXPECT_FALSE(rules.should_collect_file("third/top.py"));
}

TEST(PrefixTrieTest, DeepestRuleWins) {
    PrefixTrie trie;
    trie.insert("a", PathFlag::IGNORE);
    trie.insert("a/b", PathFlag::INCLUDE);
    EXPECT_EQ(trie.check("a/x"), PathFlag::IGNORE);
    EXPECT_EQ(trie.check("a/b/c"), PathFlag::INCLUDE);
    EXPECT_EQ(trie.check("z"), PathFlag::NONE);
    EXPECT_TRUE(trie.has_descendant_with("a", PathFlag::INCLUDE));
    EXPECT_FALSE(trie.has_descendant_with("a/b/c", PathFlag::INCLUDE));
}
