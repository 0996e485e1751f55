#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct LaunchSpec {
    std::vector<std::string> args;
};

// How a child process ended. Both fields are empty when the status could not
// be collected.
struct ExitStatus {
    std::optional<int> exit_code;
    std::optional<int> term_signal;
};

class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual int pid() const = 0;

    // Hand over the read end of the stdout/stderr pipe. The caller owns the
    // returned fd. Returns -1 if the stream is unavailable or already taken.
    virtual int take_stdout() = 0;
    virtual int take_stderr() = 0;

    // Non-blocking. Holds an empty optional while the process is still running.
    virtual std::expected<std::optional<ExitStatus>, std::string> poll_exit() = 0;

    // Send SIGTERM and return immediately.
    virtual void request_terminate() = 0;

    // SIGTERM, wait up to `grace`, then SIGKILL. Always reaps.
    virtual ExitStatus terminate(std::chrono::milliseconds grace) = 0;

    // SIGKILL and reap.
    virtual ExitStatus kill() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    virtual std::expected<std::unique_ptr<ChildProcess>, std::string>
    spawn(const std::string& device_id, const LaunchSpec& spec) = 0;
};
