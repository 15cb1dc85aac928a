#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <string>
#include "vcs_client.hpp"

namespace fs = std::filesystem;

namespace codescope::testing {

inline fs::path make_temp_dir(const std::string& tag) {
    std::random_device rd;
    fs::path dir = fs::temp_directory_path() / ("codescope_" + tag + "_" + std::to_string(rd()));
    fs::create_directories(dir);
    return dir;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// `count` non-blank lines, each a distinct assignment.
inline std::string python_lines(size_t count, const std::string& prefix = "value") {
    std::string out;
    for (size_t i = 0; i < count; ++i) out += prefix + "_" + std::to_string(i) + " = " + std::to_string(i) + "\n";
    return out;
}

// Plays a directory that is not under version control, or a scripted repo.
class FakeVcsClient : public IVcsClient {
public:
    bool repo = false;
    std::string head_commit = "0123456789abcdef";
    std::map<std::string, int> churn_counts;
    std::map<std::string, int64_t> modified_at;
    std::map<std::string, bool> ignored;

    bool is_repository(const fs::path&) override { return repo; }

    VcsResult<std::string> head(const fs::path&) override {
        if (!repo) return VcsResult<std::string>::failure(VcsError::NotARepository);
        return VcsResult<std::string>::success(head_commit);
    }

    VcsResult<bool> is_ignored(const fs::path&, const std::string& rel) override {
        if (!repo) return VcsResult<bool>::failure(VcsError::NotARepository);
        auto it = ignored.find(rel);
        return VcsResult<bool>::success(it != ignored.end() && it->second);
    }

    VcsResult<int> churn(const fs::path&, const std::string& rel) override {
        if (!repo) return VcsResult<int>::failure(VcsError::NotARepository);
        auto it = churn_counts.find(rel);
        if (it == churn_counts.end()) return VcsResult<int>::failure(VcsError::CommandFailed, "no history");
        return VcsResult<int>::success(it->second);
    }

    VcsResult<int64_t> last_modified(const fs::path&, const std::string& rel) override {
        if (!repo) return VcsResult<int64_t>::failure(VcsError::NotARepository);
        auto it = modified_at.find(rel);
        if (it == modified_at.end()) return VcsResult<int64_t>::failure(VcsError::ParseError);
        return VcsResult<int64_t>::success(it->second);
    }
};

class TempDirTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = make_temp_dir(::testing::UnitTest::GetInstance()->current_test_info()->name());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }
};

} // namespace codescope::testing
