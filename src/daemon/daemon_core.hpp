#pragma once

#include "config.hpp"
#include "device/device_watcher.hpp"
#include "event_queue.hpp"
#include "events.hpp"
#include "log_buffer.hpp"
#include "platform/device_probe.hpp"
#include "platform/ipc_server.hpp"
#include "platform/process_launcher.hpp"
#include "session/session_registry.hpp"
#include "session/transfer_classifier.hpp"
#include "storage/history_db.hpp"

#include <expected>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

// Portable daemon logic: owns the watcher and the session registry, answers
// IPC commands, and fans queued events out to log buffers, history and
// subscribed clients. Everything here runs on the main thread except the
// watcher, pump and supervisor threads, which only talk to it through events_.
class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               DeviceProbe& probe, ProcessLauncher& launcher,
               IpcServer& ipc, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Drain queued events. Called from the main loop when notify fires.
    void dispatch_events();

    void add_subscriber(int fd);
    void remove_subscriber(int fd);

    bool shutdown_requested() const { return shutdown_requested_; }

    bool start_watcher();
    bool stop_watcher();
    std::set<std::string> list_present_devices() const;
    std::expected<void, SessionError> start_session(const std::string& device_id,
                                                    std::vector<std::string> args);
    bool stop_session(const std::string& device_id);

    // Stop the watcher, drain every session and flush the resulting events.
    void shutdown();

private:
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_logs(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);

    void record(const Event& event);
    void broadcast(const nlohmann::json& message);
    LogBuffer& device_log(const std::string& device_id);
    void system_log(const std::string& line);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    IpcServer& ipc_;

    EventQueue events_;
    DeviceWatcher watcher_;
    SessionRegistry registry_;

    HistoryDb history_db_;
    TransferClassifier classifier_;
    LogBuffer system_log_;
    std::map<std::string, LogBuffer> device_logs_;
    std::vector<int> subscribers_;

    bool shutdown_requested_ = false;
    bool shut_down_ = false;
};
