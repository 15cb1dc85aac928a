#include "test_helpers.hpp"
#include "content_reader.hpp"
#include "retrieval_engine.hpp"

using namespace codescope;
using codescope::testing::TempDirTest;

namespace {

RepoSnapshot make_snapshot(const std::map<std::string, std::string>& files) {
    RepoSnapshot snap;
    snap.root = "/work/project";
    for (const auto& [path, text] : files) {
        FileRecord rec;
        rec.path = path;
        rec.language = Language::Python;
        rec.text = text;
        rec.sloc = count_sloc(text);
        rec.content_hash = sha256_hex(text);
        snap.files[path] = rec;
    }
    snap.refresh_derived();
    return snap;
}

} // namespace

class RetrievalEngineTest : public TempDirTest {};

TEST_F(RetrievalEngineTest, RetrieveBeforePrepareIsEmpty) {
    RetrievalEngine engine;
    EXPECT_TRUE(engine.retrieve("anything").empty());
}

TEST_F(RetrievalEngineTest, PersistsAndReusesIndex) {
    auto snap = make_snapshot({
        {"auth.py", "def login(user):\n    return token_for(user)\n"},
        {"db.py", "def connect(url):\n    return pool.open(url)\n"},
    });

    RetrievalEngine first(test_dir / "indexes");
    first.prepare(snap);
    EXPECT_FALSE(first.loaded_from_cache());
    auto path = first.index_path_for(snap);
    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(fs::exists(*path));

    RetrievalEngine second(test_dir / "indexes");
    second.prepare(snap);
    EXPECT_TRUE(second.loaded_from_cache());

    auto hits = second.retrieve("login token", 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].chunk->path, "auth.py");
    EXPECT_GE(second.last_latency_ms(), 0.0);
}

TEST_F(RetrievalEngineTest, ChangedContentRebuildsIndex) {
    RetrievalEngine engine(test_dir / "indexes");
    engine.prepare(make_snapshot({{"a.py", "alpha = 1\n"}}));
    engine.prepare(make_snapshot({{"a.py", "omega = 1\n"}}));
    EXPECT_FALSE(engine.loaded_from_cache());

    auto hits = engine.retrieve("omega");
    ASSERT_FALSE(hits.empty());
    EXPECT_GT(hits[0].score, 0.0);
}

TEST_F(RetrievalEngineTest, DefaultTopKComesFromOptions) {
    std::map<std::string, std::string> files;
    for (int i = 0; i < 8; ++i) files["m" + std::to_string(i) + ".py"] = "shared_word = " + std::to_string(i) + "\n";
    IndexOptions opts;
    opts.top_k = 3;
    RetrievalEngine engine(std::nullopt, opts);
    engine.prepare(make_snapshot(files));

    EXPECT_EQ(engine.retrieve("shared_word").size(), 3u);
    EXPECT_EQ(engine.retrieve("shared_word", 6).size(), 6u);
    EXPECT_FALSE(engine.index_path_for(make_snapshot(files)).has_value());
}

TEST(PreviewTest, CollapsesWhitespaceAndTruncates) {
    EXPECT_EQ(make_preview("  def  f():\n\n\treturn 1  "), "def f(): return 1");
    EXPECT_EQ(make_preview(std::string(500, 'x')).size(), 200u);
    EXPECT_EQ(make_preview("caf\xC3\xA9 au lait", 4), "caf\xC3\xA9");
}
