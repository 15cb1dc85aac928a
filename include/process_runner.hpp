#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codescope {

struct ProcessResult {
    int exit_code = -1;       // -1 when killed or terminated by a signal
    std::string output;       // captured stdout
    bool timed_out = false;
};

// Exit code execvp failures report from the child.
constexpr int EXEC_FAILED_EXIT_CODE = 127;

/**
 * Runs argv[0] (looked up on PATH) without a shell, capturing stdout.
 * stderr and stdin are bound to /dev/null. The child is killed with SIGKILL
 * once `timeout` elapses.
 * @throws std::runtime_error if the pipe or fork cannot be created.
 */
ProcessResult run_process(
    const std::vector<std::string>& argv,
    std::chrono::milliseconds timeout,
    const std::optional<std::filesystem::path>& cwd = std::nullopt
);

} // namespace codescope
