#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

} // namespace

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::unexpected(std::string("empty command"));
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(saved));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: stdout/stderr into the pipes, then exec
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    ProcessResult result;
    pollfd fds[2] = {
        {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
    };
    int open_fds = 2;
    bool timed_out = false;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (open_fds > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        int ret = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            char buf[8192];
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                (i == 0 ? result.out : result.err).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }

    for (auto& p : fds) {
        if (p.fd >= 0) ::close(p.fd);
    }

    if (timed_out) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (timed_out) {
        return std::unexpected(std::format("{} timed out after {}ms", argv[0], timeout.count()));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}
