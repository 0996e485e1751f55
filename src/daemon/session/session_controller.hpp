#pragma once

#include "platform/process_launcher.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

enum class SessionState { Starting, Running, StopRequested, Terminated };

const char* session_state_name(SessionState state);

// Lifecycle of the one external process that mirrors one device.
//
//   Starting ──attach──> Running ──poll_exit──> Terminated
//      │                    │                       ^
//      └────request_stop────┴──> StopRequested ─────┘ (finish / attach)
//
// Every transition swaps the phase under mutex_ and inspects what it replaced,
// so whichever path takes the process handle out of Running owns its end.
class SessionController {
public:
    SessionController(std::string device_id, LaunchSpec spec);

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    const std::string& device_id() const { return device_id_; }
    const LaunchSpec& launch_spec() const { return spec_; }

    using RunningCallback = std::function<void(int pid)>;

    // Starting -> Running, then on_running with no controller lock held. Until
    // on_running returns, wait_announced() blocks, so whoever ends the session
    // can announce the end only after the start.
    // If a stop claimed the controller while the spawn was in flight, the
    // process is killed here, the controller terminates and false is returned.
    bool attach(std::unique_ptr<ChildProcess> process, const RunningCallback& on_running = {});

    // Returns once the Running announcement from attach() has been made.
    void wait_announced() const;

    // Starting -> Terminated for a spawn that produced no usable process.
    void abandon();

    // Starting|Running -> StopRequested. Returns the process if one was running;
    // the caller is then responsible for terminating it and calling finish().
    std::unique_ptr<ChildProcess> request_stop();

    // StopRequested -> Terminated.
    void finish(std::optional<int> exit_code);

    // Running -> Terminated when the process has exited on its own. A failure
    // to query the process counts as an exit with an unknown status.
    std::optional<ExitStatus> poll_exit();

    SessionState state() const;
    std::optional<int> pid() const;
    std::optional<int> exit_code() const;

    // Seconds spent in Running, up to now or until it left Running.
    double uptime() const;

private:
    struct Starting {};
    struct Running {
        std::unique_ptr<ChildProcess> process;
    };
    struct StopRequested {};
    struct Terminated {
        std::optional<int> exit_code;
    };
    using Phase = std::variant<Starting, Running, StopRequested, Terminated>;

    void mark_ended();

    const std::string device_id_;
    const LaunchSpec spec_;

    // Taken before mutex_ and held by attach() across on_running.
    mutable std::mutex announce_mutex_;
    mutable std::mutex mutex_;
    Phase phase_{Starting{}};
    std::optional<int> pid_;
    std::chrono::steady_clock::time_point running_since_;
    std::optional<std::chrono::steady_clock::time_point> running_until_;
};
