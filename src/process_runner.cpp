#include "process_runner.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codescope {

namespace {

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

[[noreturn]] void exec_child(const std::vector<std::string>& argv,
                             const std::optional<std::filesystem::path>& cwd,
                             int write_fd) {
    dup2(write_fd, STDOUT_FILENO);
    close(write_fd);

    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        dup2(devnull, STDERR_FILENO);
        close(devnull);
    }

    if (cwd && chdir(cwd->c_str()) != 0) _exit(EXEC_FAILED_EXIT_CODE);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    execvp(args[0], args.data());
    _exit(EXEC_FAILED_EXIT_CODE);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

ProcessResult run_process(
    const std::vector<std::string>& argv,
    std::chrono::milliseconds timeout,
    const std::optional<std::filesystem::path>& cwd)
{
    if (argv.empty()) throw std::runtime_error("run_process: empty argv");

    int fds[2];
    if (pipe(fds) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        close(fds[0]);
        exec_child(argv, cwd, fds[1]);
    }

    close(fds[1]);
    ProcessResult result;
    const auto deadline = Clock::now() + timeout;

    // Phase 1: drain stdout until EOF or deadline.
    std::array<char, 4096> buffer;
    while (true) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            result.timed_out = true;
            break;
        }
        pollfd pfd{fds[0], POLLIN, 0};
        int rc = poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.timed_out = true;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = read(fds[0], buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        result.output.append(buffer.data(), static_cast<size_t>(n));
    }
    close(fds[0]);

    // Phase 2: reap, killing the child if it outlives the deadline.
    int status = 0;
    while (!result.timed_out) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            result.exit_code = decode_status(status);
            return result;
        }
        if (done < 0 && errno != EINTR) {
            return result;
        }
        if (remaining_ms(deadline) == 0) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    result.exit_code = -1;
    return result;
}

} // namespace codescope
