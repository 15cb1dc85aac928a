#include "vcs_client.hpp"
#include "process_runner.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace codescope {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

std::string to_string(VcsError err) {
    switch (err) {
        case VcsError::None: return "none";
        case VcsError::NotARepository: return "not a repository";
        case VcsError::Unavailable: return "vcs unavailable";
        case VcsError::Timeout: return "timeout";
        case VcsError::CommandFailed: return "command failed";
        case VcsError::ParseError: return "parse error";
    }
    return "unknown";
}

GitClient::GitClient(VcsTimeouts timeouts, std::string git_binary)
    : timeouts_(timeouts), git_binary_(std::move(git_binary)) {}

bool GitClient::available() {
    std::call_once(availability_once_, [this]() {
        try {
            auto res = run_process({git_binary_, "--version"}, timeouts_.query);
            available_ = !res.timed_out && res.exit_code == 0;
        } catch (const std::exception& e) {
            spdlog::debug("git --version failed: {}", e.what());
            available_ = false;
        }
        if (!available_) spdlog::debug("git not available; VCS metadata disabled");
    });
    return available_;
}

bool GitClient::is_repository(const fs::path& root) {
    std::error_code ec;
    return fs::exists(root / ".git", ec);
}

VcsError GitClient::precondition(const fs::path& root) {
    if (!available()) return VcsError::Unavailable;
    if (!is_repository(root)) return VcsError::NotARepository;
    return VcsError::None;
}

VcsResult<GitClient::CommandOutput> GitClient::run_git(
    const fs::path& root,
    std::initializer_list<std::string> args,
    std::chrono::milliseconds timeout)
{
    std::vector<std::string> argv = {git_binary_, "-C", root.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    try {
        auto res = run_process(argv, timeout);
        if (res.timed_out) {
            return VcsResult<CommandOutput>::failure(VcsError::Timeout, "git " + *args.begin());
        }
        if (res.exit_code == EXEC_FAILED_EXIT_CODE) {
            return VcsResult<CommandOutput>::failure(VcsError::Unavailable, "exec " + git_binary_);
        }
        return VcsResult<CommandOutput>::success({res.exit_code, std::move(res.output)});
    } catch (const std::exception& e) {
        return VcsResult<CommandOutput>::failure(VcsError::Unavailable, e.what());
    }
}

VcsResult<std::string> GitClient::head(const fs::path& root) {
    if (auto err = precondition(root); err != VcsError::None) {
        return VcsResult<std::string>::failure(err);
    }
    auto res = run_git(root, {"rev-parse", "HEAD"}, timeouts_.query);
    if (!res.ok()) return VcsResult<std::string>::failure(res.error, res.detail);
    if (res.value->exit_code != 0) {
        return VcsResult<std::string>::failure(VcsError::CommandFailed, "rev-parse HEAD");
    }
    std::string sha = trim(res.value->output);
    if (sha.empty()) return VcsResult<std::string>::failure(VcsError::ParseError, "empty HEAD");
    return VcsResult<std::string>::success(sha);
}

VcsResult<bool> GitClient::is_ignored(const fs::path& root, const std::string& rel_path) {
    if (auto err = precondition(root); err != VcsError::None) {
        return VcsResult<bool>::failure(err);
    }
    auto res = run_git(root, {"check-ignore", "-q", "--", rel_path}, timeouts_.query);
    if (!res.ok()) return VcsResult<bool>::failure(res.error, res.detail);
    // 0 = ignored, 1 = not ignored, anything else is an error
    switch (res.value->exit_code) {
        case 0: return VcsResult<bool>::success(true);
        case 1: return VcsResult<bool>::success(false);
        default: return VcsResult<bool>::failure(VcsError::CommandFailed, "check-ignore " + rel_path);
    }
}

VcsResult<int> GitClient::churn(const fs::path& root, const std::string& rel_path) {
    if (auto err = precondition(root); err != VcsError::None) {
        return VcsResult<int>::failure(err);
    }
    auto res = run_git(root, {"log", "--follow", "--oneline", "--", rel_path}, timeouts_.history);
    if (!res.ok()) return VcsResult<int>::failure(res.error, res.detail);
    if (res.value->exit_code != 0) {
        return VcsResult<int>::failure(VcsError::CommandFailed, "log --follow " + rel_path);
    }

    int commits = 0;
    std::istringstream stream(res.value->output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!trim(line).empty()) commits++;
    }
    return VcsResult<int>::success(commits);
}

VcsResult<int64_t> GitClient::last_modified(const fs::path& root, const std::string& rel_path) {
    if (auto err = precondition(root); err != VcsError::None) {
        return VcsResult<int64_t>::failure(err);
    }
    auto res = run_git(root, {"log", "-1", "--format=%ct", "--", rel_path}, timeouts_.query);
    if (!res.ok()) return VcsResult<int64_t>::failure(res.error, res.detail);
    if (res.value->exit_code != 0) {
        return VcsResult<int64_t>::failure(VcsError::CommandFailed, "log -1 " + rel_path);
    }

    std::string value = trim(res.value->output);
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return VcsResult<int64_t>::failure(VcsError::ParseError, "'" + value + "'");
    }
    try {
        return VcsResult<int64_t>::success(std::stoll(value));
    } catch (const std::exception& e) {
        return VcsResult<int64_t>::failure(VcsError::ParseError, e.what());
    }
}

} // namespace codescope
