#include "platform/linux/posix_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

void close_pair(int fds[2]) {
    ::close(fds[0]);
    ::close(fds[1]);
}

} // namespace

PosixProcess::PosixProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

PosixProcess::~PosixProcess() {
    if (stdout_fd_ >= 0) ::close(stdout_fd_);
    if (stderr_fd_ >= 0) ::close(stderr_fd_);
    if (!reaped_) kill();
}

std::expected<std::unique_ptr<PosixProcess>, std::string>
PosixProcess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) {
        return std::unexpected(std::string("empty command line"));
    }

    // Build before fork: the child may only make async-signal-safe calls.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    int exec_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_pair(out_pipe);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(err));
    }
    if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // The daemon blocks SIGINT/SIGTERM for its signalfd; the mask survives exec.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvp(cargv[0], cargv.data());

        int err = errno;
        while (::write(exec_pipe[1], &err, sizeof(err)) < 0 && errno == EINTR) {}
        ::_exit(127);
    }

    // Parent. Also set the group here so signalling it never races the child.
    ::setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    // EOF on the exec pipe means exec succeeded (O_CLOEXEC closed it).
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    auto process = std::make_unique<PosixProcess>(pid, out_pipe[0], err_pipe[0]);
    if (n > 0) {
        process->wait();
        return std::unexpected(std::format("cannot execute {}: {}", argv[0],
                                           std::strerror(child_errno)));
    }
    return process;
}

int PosixProcess::take_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

int PosixProcess::take_stderr() {
    int fd = stderr_fd_;
    stderr_fd_ = -1;
    return fd;
}

std::expected<std::optional<ExitStatus>, std::string> PosixProcess::poll_exit() {
    if (reaped_) return std::optional<ExitStatus>(status_);

    int wstatus = 0;
    pid_t r = ::waitpid(pid_, &wstatus, WNOHANG);
    if (r == 0) return std::optional<ExitStatus>();
    if (r < 0) {
        if (errno == EINTR) return std::optional<ExitStatus>();
        int err = errno;
        if (err == ECHILD) reaped_ = true; // reaped elsewhere; never signal this pid again
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(err));
    }

    record(wstatus);
    return std::optional<ExitStatus>(status_);
}

void PosixProcess::request_terminate() {
    if (!reaped_) signal_group(SIGTERM);
}

ExitStatus PosixProcess::terminate(std::chrono::milliseconds grace) {
    if (reaped_) return status_;

    signal_group(SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        auto polled = poll_exit();
        if (!polled) return status_;
        if (polled->has_value()) return **polled;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return kill();
}

ExitStatus PosixProcess::kill() {
    if (reaped_) return status_;
    signal_group(SIGKILL);
    return wait();
}

ExitStatus PosixProcess::wait() {
    if (reaped_) return status_;

    int wstatus = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &wstatus, 0);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        record(wstatus);
    } else {
        reaped_ = true;
    }
    return status_;
}

void PosixProcess::signal_group(int sig) {
    if (::kill(-pid_, sig) < 0) {
        ::kill(pid_, sig);
    }
}

void PosixProcess::record(int wstatus) {
    reaped_ = true;
    if (WIFEXITED(wstatus)) {
        status_.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        status_.term_signal = WTERMSIG(wstatus);
    }
}
