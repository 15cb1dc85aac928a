#include "test_helpers.hpp"
#include "code_graph.hpp"
#include "content_reader.hpp"
#include "repo_scanner.hpp"

using namespace codescope;
using codescope::testing::FakeVcsClient;
using codescope::testing::TempDirTest;
using codescope::testing::python_lines;
using codescope::testing::write_file;

namespace {

void add_file(RepoSnapshot& snap, const std::string& path, Language lang, const std::string& text) {
    FileRecord rec;
    rec.path = path;
    rec.language = lang;
    rec.text = text;
    rec.sloc = count_sloc(text);
    rec.content_hash = sha256_hex(text);
    snap.files[path] = rec;
}

} // namespace

TEST(ImportExtractionTest, PythonTopLevelModules) {
    auto imports = extract_imports(Language::Python,
        "import os\n"
        "import numpy as np, pkg.sub.mod\n"
        "from utils.helpers import load\n"
        "from .sibling import thing\n"
        "from . import nothing\n"
        "    import nested\n"
        "x = 'import fake'\n");
    std::set<std::string> expected = {"os", "numpy", "pkg", "utils", "sibling", "nested"};
    EXPECT_EQ(imports, expected);
}

TEST(ImportExtractionTest, JavaScriptSpecifiers) {
    auto imports = extract_imports(Language::TypeScript,
        "import React from 'react';\n"
        "import { a, b } from \"./lib/util\";\n"
        "import './styles.css';\n"
        "const fs = require('fs');\n"
        "const local = require( '../shared/config' );\n");
    std::set<std::string> expected = {"react", "./lib/util", "./styles.css", "fs", "../shared/config"};
    EXPECT_EQ(imports, expected);
}

TEST(ImportExtractionTest, MinifiedLinesAreScannedLinearly) {
    const std::string unterminated = "import x" + std::string(200000, 'a') + ";";
    EXPECT_TRUE(extract_imports(Language::JavaScript, unterminated).empty());

    std::string bundle;
    for (int i = 0; i < 5000; ++i) bundle += "var v" + std::to_string(i) + "=require('./m" + std::to_string(i % 3) + "');";
    bundle += "import {z} from \"./last\";" + std::string(100000, ' ');
    auto imports = extract_imports(Language::JavaScript, bundle);
    EXPECT_EQ(imports, (std::set<std::string>{"./m0", "./m1", "./m2", "./last"}));
}

TEST(ImportExtractionTest, SideEffectImportAfterBareImport) {
    auto imports = extract_imports(Language::JavaScript, "import a; import 'polyfill';");
    EXPECT_EQ(imports, std::set<std::string>{"polyfill"});
    EXPECT_TRUE(extract_imports(Language::JavaScript, "reimport q from 'no'; imports('x');").empty());
}

TEST(CodeGraphTest, ResolvesPythonImportsByStem) {
    RepoSnapshot snap;
    add_file(snap, "app/main.py", Language::Python, "import models\nfrom services import run\nimport os\n");
    add_file(snap, "app/models.py", Language::Python, "x = 1\n");
    add_file(snap, "app/services.py", Language::Python, "import models\n");

    auto graph = CodeGraph::build(snap);
    EXPECT_EQ(graph.node_count(), 3u);
    EXPECT_EQ(graph.dependencies_of("app/main.py"), (std::set<std::string>{"app/models.py", "app/services.py"}));
    EXPECT_TRUE(graph.dependencies_of("app/models.py").empty());
    EXPECT_EQ(graph.edge_count(), 3u);

    auto users = graph.dependents_of("app/models.py");
    EXPECT_EQ(users, (std::vector<std::string>{"app/main.py", "app/services.py"}));
}

TEST(CodeGraphTest, ResolvesRelativeScriptImports) {
    RepoSnapshot snap;
    add_file(snap, "web/app.js", Language::JavaScript, "import { api } from './api/client';\nconst _ = require('lodash');\n");
    add_file(snap, "web/api/client.js", Language::JavaScript, "const cfg = require('../config');\n");
    add_file(snap, "web/config.ts", Language::TypeScript, "export const url = '';\n");

    auto graph = CodeGraph::build(snap);
    EXPECT_EQ(graph.dependencies_of("web/app.js"), std::set<std::string>{"web/api/client.js"});
    EXPECT_EQ(graph.dependencies_of("web/api/client.js"), std::set<std::string>{"web/config.ts"});
    EXPECT_TRUE(graph.dependencies_of("web/config.ts").empty());
    EXPECT_TRUE(graph.dependencies_of("unknown.js").empty());
}

TEST(CodeGraphTest, JsonListsNodesAndEdges) {
    RepoSnapshot snap;
    add_file(snap, "a.py", Language::Python, "import b\n");
    add_file(snap, "b.py", Language::Python, "y = 2\n");

    auto j = CodeGraph::build(snap).to_json();
    EXPECT_EQ(j["nodes"].size(), 2u);
    ASSERT_EQ(j["edges"].size(), 1u);
    EXPECT_EQ(j["edges"][0]["source"].get<std::string>(), "a.py");
    EXPECT_EQ(j["edges"][0]["target"].get<std::string>(), "b.py");
}

TEST(HotspotTest, EmptySnapshotHasNoHotspots) {
    RepoSnapshot snap;
    EXPECT_TRUE(CodeGraph::build(snap).hotspots(snap).empty());
}

TEST(HotspotTest, WeighsSizeAndCouplingWithoutHistory) {
    RepoSnapshot snap;
    add_file(snap, "big.py", Language::Python, python_lines(40));
    add_file(snap, "hub.py", Language::Python, "import big\nimport leaf\n");
    add_file(snap, "leaf.py", Language::Python, python_lines(10));

    auto ranked = CodeGraph::build(snap).hotspots(snap);
    ASSERT_EQ(ranked.size(), 3u);
    // big: 0.3 * 40/40 + 0.2 * 1/2; hub: 0.3 * 2/40 + 0.2 * 2/2; leaf: 0.3 * 10/40 + 0.2 * 1/2
    EXPECT_EQ(ranked[0].path, "big.py");
    EXPECT_NEAR(ranked[0].score, 0.4, 1e-12);
    EXPECT_EQ(ranked[1].path, "hub.py");
    EXPECT_NEAR(ranked[1].score, 0.215, 1e-12);
    EXPECT_EQ(ranked[2].path, "leaf.py");
    EXPECT_NEAR(ranked[2].score, 0.175, 1e-12);
}

class HotspotScanTest : public TempDirTest {};

TEST_F(HotspotScanTest, ChurnFromHistoryDominates) {
    write_file(test_dir / "stable.py", python_lines(50, "s"));
    write_file(test_dir / "busy.py", python_lines(5, "b"));
    write_file(test_dir / "quiet.py", python_lines(5, "q"));

    auto vcs = std::make_shared<FakeVcsClient>();
    vcs->repo = true;
    vcs->churn_counts["busy.py"] = 30;
    vcs->churn_counts["stable.py"] = 1;
    vcs->modified_at["busy.py"] = 1700000000;

    RepoScanner scanner(std::make_shared<MemoryCacheStore>(), vcs);
    auto snap = scanner.scan(test_dir.string());
    ASSERT_EQ(snap->vcs.churn_by_file.at("busy.py"), 30);

    auto ranked = CodeGraph::build(*snap).hotspots(*snap);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].path, "busy.py");
    EXPECT_NEAR(ranked[0].score, 0.5 + 0.3 * 5.0 / 50.0, 1e-12);
    EXPECT_EQ(ranked[1].path, "stable.py");
    EXPECT_EQ(ranked[2].path, "quiet.py");
    for (size_t i = 1; i < ranked.size(); ++i) EXPECT_GE(ranked[i - 1].score, ranked[i].score);
}
