#include "test_helpers.hpp"
#include "content_reader.hpp"

using namespace codescope;
using codescope::testing::TempDirTest;
using codescope::testing::write_file;

class ContentReaderTest : public TempDirTest {};

TEST(BinarySniffTest, NulByteMeansBinary) {
    std::string sample = "print('hi')\n";
    sample.push_back('\0');
    EXPECT_TRUE(looks_binary(sample));
}

TEST(BinarySniffTest, PlainSourceIsText) {
    EXPECT_FALSE(looks_binary("def main():\n\treturn 0\r\n"));
    EXPECT_FALSE(looks_binary(""));
}

TEST(BinarySniffTest, MostlyHighBytesIsBinary) {
    std::string sample(100, 'a');
    sample += std::string(60, '\xC3');
    EXPECT_TRUE(looks_binary(sample));

    std::string mostly_text(100, 'a');
    mostly_text += std::string(20, '\xC3');
    EXPECT_FALSE(looks_binary(mostly_text));
}

TEST(Utf8Test, InvalidSequencesAreReplaced) {
    EXPECT_EQ(decode_utf8_lossy("abc"), "abc");
    EXPECT_EQ(decode_utf8_lossy("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(decode_utf8_lossy("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    // Truncated three-byte sequence at the end
    EXPECT_EQ(decode_utf8_lossy("x\xE2\x82"), "x\xEF\xBF\xBD");
}

TEST(Utf8Test, SafeSubstrCountsCodePoints) {
    const std::string text = "h\xC3\xA9llo";
    EXPECT_EQ(utf8_safe_substr(text, 2), "h\xC3\xA9");
    EXPECT_EQ(utf8_safe_substr(text, 100), text);
    EXPECT_EQ(utf8_safe_substr(text, 0), "");
}

TEST(SlocTest, CountsNonBlankLines) {
    EXPECT_EQ(count_sloc(""), 0u);
    EXPECT_EQ(count_sloc("a\n\n  \nb\n"), 2u);
    EXPECT_EQ(count_sloc("one\r\ntwo\r\n\t\r\n"), 2u);
    EXPECT_EQ(count_sloc("no trailing newline"), 1u);
    EXPECT_TRUE(is_blank(" \t\r\n"));
    EXPECT_FALSE(is_blank("  x "));
}

TEST(SlocTest, LoneCarriageReturnAndFormFeedEndLines) {
    EXPECT_EQ(count_sloc("a\fb\rc"), 3u);
    EXPECT_EQ(count_sloc("x\v\f\ny"), 2u);
}

TEST(SplitLinesTest, UniversalNewlines) {
    using Lines = std::vector<std::string_view>;
    EXPECT_TRUE(split_lines("").empty());
    EXPECT_EQ(split_lines("a\nb\n"), (Lines{"a", "b"}));
    EXPECT_EQ(split_lines("a\r\nb\rc"), (Lines{"a", "b", "c"}));
    EXPECT_EQ(split_lines("a\r\r\nb"), (Lines{"a", "", "b"}));
    EXPECT_EQ(split_lines("a\vb\fc\x1d" "d"), (Lines{"a", "b", "c", "d"}));
    EXPECT_EQ(split_lines("one\xe2\x80\xa8two\xc2\x85three"), (Lines{"one", "two", "three"}));
    EXPECT_EQ(split_lines("\n\n"), (Lines{"", ""}));
    // Other multibyte text is left whole.
    EXPECT_EQ(split_lines("caf\xc3\xa9\xe2\x80\x99s"), (Lines{"caf\xc3\xa9\xe2\x80\x99s"}));
}

TEST(HashTest, KnownDigests) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha1_hex("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(ContentReaderTest, ReadsTextFile) {
    auto path = test_dir / "mod.py";
    write_file(path, "import os\nprint(os.getcwd())\n");
    EXPECT_EQ(read_text(path), "import os\nprint(os.getcwd())\n");
}

TEST_F(ContentReaderTest, BinaryFileReadsAsEmpty) {
    auto path = test_dir / "blob.py";
    std::string data = "header";
    data.push_back('\0');
    data += "payload";
    write_file(path, data);
    EXPECT_EQ(read_text(path), "");
}

TEST_F(ContentReaderTest, LargeFileIsTruncated) {
    auto path = test_dir / "big.js";
    write_file(path, std::string(10000, 'x'));
    EXPECT_EQ(read_text(path, 5000).size(), 5000u);
    EXPECT_EQ(read_text(path, 100).size(), 100u);
}

TEST_F(ContentReaderTest, MissingFileReadsAsEmpty) {
    EXPECT_EQ(read_text(test_dir / "nope.py"), "");
    EXPECT_FALSE(read_first_line(test_dir / "nope.py").has_value());
}

TEST_F(ContentReaderTest, FirstLineStopsAtNewline) {
    auto path = test_dir / "tool";
    write_file(path, "#!/usr/bin/env python\nprint(1)\n");
    auto line = read_first_line(path);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "#!/usr/bin/env python\n");
}
