#include <gtest/gtest.h>
#include "language.hpp"

using namespace codescope;

TEST(LanguageTest, DetectsByExtension) {
    EXPECT_EQ(detect_language("pkg/mod.py", std::nullopt), Language::Python);
    EXPECT_EQ(detect_language("tools/gui.pyw", std::nullopt), Language::Python);
    EXPECT_EQ(detect_language("web/app.js", std::nullopt), Language::JavaScript);
    EXPECT_EQ(detect_language("web/esm.mjs", std::nullopt), Language::JavaScript);
    EXPECT_EQ(detect_language("web/legacy.cjs", std::nullopt), Language::JavaScript);
    EXPECT_EQ(detect_language("ui/view.ts", std::nullopt), Language::TypeScript);
    EXPECT_EQ(detect_language("ui/View.tsx", std::nullopt), Language::TypeScript);
}

TEST(LanguageTest, ExtensionIsCaseInsensitive) {
    EXPECT_EQ(detect_language("SCRIPT.PY", std::nullopt), Language::Python);
    EXPECT_EQ(detect_language("Index.Ts", std::nullopt), Language::TypeScript);
}

TEST(LanguageTest, FallsBackToShebang) {
    EXPECT_EQ(detect_language("bin/tool", std::string("#!/usr/bin/env python3\n")), Language::Python);
    EXPECT_EQ(detect_language("bin/serve", std::string("#!/usr/bin/env node\n")), Language::JavaScript);
    EXPECT_EQ(detect_language("bin/run", std::string("#!/usr/bin/env -S deno run\n")), Language::JavaScript);
}

TEST(LanguageTest, UnknownFilesAreNotSource) {
    EXPECT_FALSE(detect_language("README.md", std::nullopt).has_value());
    EXPECT_FALSE(detect_language("Makefile", std::string("all:\n")).has_value());
    EXPECT_FALSE(detect_language("bin/run.sh", std::string("#!/bin/sh\n")).has_value());
    EXPECT_FALSE(detect_language("noext", std::nullopt).has_value());
}

TEST(LanguageTest, ExtensionWinsOverShebang) {
    EXPECT_EQ(detect_language("x.js", std::string("#!/usr/bin/env python\n")), Language::JavaScript);
}

TEST(LanguageTest, NamesRoundTripThroughTable) {
    for (const auto& mapping : extension_table()) {
        auto name = to_string(mapping.language);
        auto back = language_from_string(name);
        ASSERT_TRUE(back.has_value()) << name;
        EXPECT_EQ(*back, mapping.language);
    }
    EXPECT_EQ(to_string(Language::Python), "python");
    EXPECT_FALSE(language_from_string("cobol").has_value());
}
