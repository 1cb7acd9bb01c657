#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        std::println(stderr, "setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Upload chunks and transcripts are private to the owning user.
    umask(077);

    // Paths are absolute from here on; keep no directory busy.
    if (chdir("/") < 0) _exit(1);

    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) _exit(1);
    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(null_fd, STDOUT_FILENO);
    ::dup2(null_fd, STDERR_FILENO);
    if (null_fd > STDERR_FILENO) ::close(null_fd);
}

} // namespace platform
