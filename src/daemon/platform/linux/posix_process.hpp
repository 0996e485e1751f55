#pragma once

#include "platform/process_launcher.hpp"

#include <expected>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

// fork/exec child with stdin on /dev/null and stdout/stderr piped back.
// The child leads its own process group; signals go to the whole group.
// Destroying an unreaped PosixProcess kills and reaps it.
class PosixProcess : public ChildProcess {
public:
    PosixProcess(pid_t pid, int stdout_fd, int stderr_fd);
    ~PosixProcess() override;

    PosixProcess(const PosixProcess&) = delete;
    PosixProcess& operator=(const PosixProcess&) = delete;

    // argv[0] is looked up in PATH when it has no slash. Exec failure is
    // reported here rather than as an exit status.
    static std::expected<std::unique_ptr<PosixProcess>, std::string>
    spawn(const std::vector<std::string>& argv);

    int pid() const override { return pid_; }
    int take_stdout() override;
    int take_stderr() override;
    std::expected<std::optional<ExitStatus>, std::string> poll_exit() override;
    void request_terminate() override;
    ExitStatus terminate(std::chrono::milliseconds grace) override;
    ExitStatus kill() override;

    // Block until the process exits.
    ExitStatus wait();

private:
    void signal_group(int sig);
    void record(int wstatus);

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    bool reaped_ = false;
    ExitStatus status_;
};
