#pragma once

#include "events.hpp"
#include "platform/process_launcher.hpp"
#include "session/output_pump.hpp"
#include "session/session_controller.hpp"

#include <chrono>
#include <condition_variable>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

enum class SessionErrc { AlreadyRunning, SpawnFailed, StreamCaptureFailed, ShuttingDown };

const char* session_errc_name(SessionErrc code);

struct SessionError {
    SessionErrc code;
    std::string message;
};

struct SessionInfo {
    std::string device_id;
    SessionState state;
    std::optional<int> pid;
    double uptime_s = 0.0;
    std::vector<std::string> args;
};

struct SessionOptions {
    std::chrono::milliseconds supervise_interval{500};
    std::chrono::milliseconds stop_timeout{3000};
};

// Owns one SessionController per device with a starting or running process.
//
// Locking: mutex_ guards sessions_ and is held only for lookups, inserts and
// erases. It may be held while taking a controller lock, never the reverse.
// Spawning and terminating processes happen with no lock held, and events
// are emitted with neither lock held.
class SessionRegistry {
public:
    SessionRegistry(ProcessLauncher& launcher, EventSink& sink, SessionOptions options);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Start the output pump and the exit supervisor.
    bool init();

    // AlreadyRunning leaves the existing session untouched.
    std::expected<void, SessionError> start(const std::string& device_id, LaunchSpec spec);

    // Idempotent. Returns whether a session existed for the device.
    bool stop(const std::string& device_id);

    // Devices whose process is running.
    std::set<std::string> snapshot() const;

    std::vector<SessionInfo> sessions() const;

    // Stop and reap every process; further starts fail with ShuttingDown.
    void drain_and_terminate_all();

    // Drain, give the pump a moment to flush final output, stop worker threads.
    void shutdown(std::chrono::milliseconds flush_timeout);

    // One supervision tick: finish every controller whose process has exited.
    void reap_exited();

private:
    std::expected<void, SessionError> launch(const std::shared_ptr<SessionController>& controller);
    void supervise(std::stop_token st);
    void remove_entry(const std::string& device_id, const SessionController* controller);
    void emit_ended(const SessionController& controller, std::optional<int> exit_code,
                    EndReason reason);
    void emit(Event event);

    ProcessLauncher& launcher_;
    EventSink& sink_;
    SessionOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SessionController>> sessions_;
    int spawns_in_flight_ = 0;
    bool shutting_down_ = false;
    std::condition_variable spawn_done_;

    OutputPump pump_;

    std::mutex tick_mutex_;
    std::condition_variable_any tick_;
    std::jthread supervisor_;
};
