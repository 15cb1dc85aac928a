#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace codescope {

namespace fs = std::filesystem;

enum class VcsError {
    None,
    NotARepository,
    Unavailable,     // binary missing or could not be spawned
    Timeout,
    CommandFailed,   // non-zero exit
    ParseError
};

std::string to_string(VcsError err);

// Outcome of a single VCS query. Callers at the scan boundary decide the default.
template<typename T>
struct VcsResult {
    std::optional<T> value;
    VcsError error = VcsError::None;
    std::string detail;

    static VcsResult success(T v) { return VcsResult{std::move(v), VcsError::None, {}}; }
    static VcsResult failure(VcsError err, std::string why = {}) { return VcsResult{std::nullopt, err, std::move(why)}; }

    bool ok() const { return value.has_value(); }
    T value_or(T fallback) const { return value ? *value : fallback; }
};

class IVcsClient {
public:
    virtual ~IVcsClient() = default;

    virtual bool is_repository(const fs::path& root) = 0;
    virtual VcsResult<std::string> head(const fs::path& root) = 0;
    virtual VcsResult<bool> is_ignored(const fs::path& root, const std::string& rel_path) = 0;
    // Commits touching the file, following renames.
    virtual VcsResult<int> churn(const fs::path& root, const std::string& rel_path) = 0;
    // Unix seconds of the last commit touching the file.
    virtual VcsResult<int64_t> last_modified(const fs::path& root, const std::string& rel_path) = 0;
};

struct VcsTimeouts {
    std::chrono::milliseconds query{5000};
    std::chrono::milliseconds history{10000};
};

class GitClient : public IVcsClient {
public:
    explicit GitClient(VcsTimeouts timeouts = {}, std::string git_binary = "git");

    bool is_repository(const fs::path& root) override;
    VcsResult<std::string> head(const fs::path& root) override;
    VcsResult<bool> is_ignored(const fs::path& root, const std::string& rel_path) override;
    VcsResult<int> churn(const fs::path& root, const std::string& rel_path) override;
    VcsResult<int64_t> last_modified(const fs::path& root, const std::string& rel_path) override;

    bool available();

private:
    struct CommandOutput {
        int exit_code;
        std::string output;
    };

    VcsResult<CommandOutput> run_git(const fs::path& root,
                                     std::initializer_list<std::string> args,
                                     std::chrono::milliseconds timeout);
    VcsError precondition(const fs::path& root);

    VcsTimeouts timeouts_;
    std::string git_binary_;
    std::once_flag availability_once_;
    bool available_ = false;
};

} // namespace codescope
