#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <unistd.h>

namespace platform {

namespace {

void redirect_to_null(int target, int flags) {
    int fd = ::open("/dev/null", flags);
    if (fd < 0) return;
    if (fd != target) {
        ::dup2(fd, target);
        ::close(fd);
    }
}

} // namespace

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

    // Second fork so the daemon can never reacquire a terminal.
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    std::fflush(stdout);
    std::fflush(stderr);
    redirect_to_null(STDIN_FILENO, O_RDONLY);
    redirect_to_null(STDOUT_FILENO, O_WRONLY);
    redirect_to_null(STDERR_FILENO, O_WRONLY);
}

} // namespace platform
