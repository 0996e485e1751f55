#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <type_traits>

namespace {

std::string join(const std::set<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

nlohmann::json error(std::string message) {
    return {{"status", "error"}, {"message", std::move(message)}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       DeviceProbe& probe, ProcessLauncher& launcher,
                       IpcServer& ipc, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose), ipc_(ipc),
      events_(std::move(notify)),
      watcher_(probe, events_, config_.watcher.poll_interval()),
      registry_(launcher, events_,
                SessionOptions{
                    .supervise_interval = std::chrono::milliseconds(
                        config_.session.supervise_interval_ms),
                    .stop_timeout = std::chrono::milliseconds(config_.session.stop_timeout_ms),
                }),
      system_log_(config_.logs.max_lines) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    if (!history_db_.open(platform::history_db_path())) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    if (!registry_.init()) {
        std::println(stderr, "Failed to start session supervisor");
        return false;
    }

    if (config_.watcher.autostart) {
        start_watcher();
    }
    return true;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    try {
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "devices") {
            return {{"status", "ok"}, {"devices", watcher_.snapshot()}};
        }
        if (cmd_str == "sessions") {
            return {{"status", "ok"}, {"sessions", list_present_devices()}};
        }
        if (cmd_str == "start") return handle_start(cmd);
        if (cmd_str == "stop") return handle_stop(cmd);
        if (cmd_str == "watch_start") {
            start_watcher();
            return {{"status", "ok"}};
        }
        if (cmd_str == "watch_stop") {
            stop_watcher();
            return {{"status", "ok"}};
        }
        if (cmd_str == "logs") return handle_logs(cmd);
        if (cmd_str == "clear_logs") {
            system_log_.reset();
            device_logs_.clear();
            return {{"status", "ok"}};
        }
        if (cmd_str == "history") return handle_history(cmd);
        // The event loop registers the connection once it sees this succeed.
        if (cmd_str == "subscribe") return {{"status", "ok"}};
        if (cmd_str == "shutdown") {
            log("Shutdown requested over IPC");
            shutdown_requested_ = true;
            return {{"status", "ok"}};
        }
    } catch (const nlohmann::json::exception& e) {
        return error(std::format("bad request: {}", e.what()));
    }
    return error("unknown command");
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& s : registry_.sessions()) {
        nlohmann::json j = {
            {"device", s.device_id},
            {"state", session_state_name(s.state)},
            {"uptime", s.uptime_s},
            {"args", s.args},
        };
        if (s.pid) j["pid"] = *s.pid;
        sessions.push_back(std::move(j));
    }
    return {
        {"status", "ok"},
        {"watcher", watcher_.running()},
        {"devices", watcher_.snapshot()},
        {"sessions", std::move(sessions)},
    };
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& cmd) {
    auto device = cmd.value("device", "");
    if (device.empty()) return error("missing device");

    std::vector<std::string> args = config_.session.default_args;
    if (cmd.contains("args")) {
        args = cmd["args"].get<std::vector<std::string>>();
    }

    auto result = start_session(device, std::move(args));
    if (!result) {
        return {
            {"status", "error"},
            {"code", session_errc_name(result.error().code)},
            {"message", result.error().message},
        };
    }
    return {{"status", "ok"}};
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& cmd) {
    auto device = cmd.value("device", "");
    if (device.empty()) return error("missing device");
    return {{"status", "ok"}, {"stopped", stop_session(device)}};
}

nlohmann::json DaemonCore::handle_logs(const nlohmann::json& cmd) {
    auto device = cmd.value("device", "");
    size_t limit = cmd.value("limit", config_.logs.max_lines);

    std::vector<std::string> lines;
    if (device.empty()) {
        lines = system_log_.recent(limit);
    } else if (auto it = device_logs_.find(device); it != device_logs_.end()) {
        lines = it->second.recent(limit);
    }
    return {{"status", "ok"}, {"lines", std::move(lines)}};
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    int limit = cmd.value("limit", 10);
    auto entries = history_db_.recent(limit, cmd.value("device", ""));

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        nlohmann::json j = {
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"device", e.device_id},
            {"args", e.args},
            {"duration", e.duration},
            {"exit_code", nullptr},
            {"reason", e.end_reason},
        };
        if (e.exit_code) j["exit_code"] = *e.exit_code;
        resp["entries"].push_back(std::move(j));
    }
    return resp;
}

bool DaemonCore::start_watcher() {
    if (!watcher_.start()) return false;
    log(std::format("Device watcher started ({} ms interval)", config_.watcher.poll_interval_ms));
    return true;
}

bool DaemonCore::stop_watcher() {
    if (!watcher_.running()) return false;
    watcher_.stop();
    log("Device watcher stopped");
    return true;
}

std::set<std::string> DaemonCore::list_present_devices() const {
    return registry_.snapshot();
}

std::expected<void, SessionError> DaemonCore::start_session(const std::string& device_id,
                                                            std::vector<std::string> args) {
    auto result = registry_.start(device_id, LaunchSpec{.args = std::move(args)});
    if (!result) {
        log(std::format("Start {} failed: {}", device_id, result.error().message));
    }
    return result;
}

bool DaemonCore::stop_session(const std::string& device_id) {
    bool stopped = registry_.stop(device_id);
    log(stopped ? "Stopped session for " + device_id : "No session to stop for " + device_id);
    return stopped;
}

void DaemonCore::dispatch_events() {
    // Recording an event may queue a derived one (transfer notices), so loop.
    for (auto batch = events_.drain(); !batch.empty(); batch = events_.drain()) {
        for (const auto& event : batch) {
            record(event);
            if (!subscribers_.empty()) broadcast(event_to_json(event));
        }
    }
}

void DaemonCore::record(const Event& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, DeviceConnected>) {
            system_log("device connected: " + join(e.devices));
        } else if constexpr (std::is_same_v<T, DeviceDisconnected>) {
            system_log("device disconnected: " + join(e.devices));
            if (config_.session.stop_on_disconnect) {
                for (const auto& device : e.devices) {
                    if (registry_.stop(device)) {
                        system_log("stopped session for disconnected device " + device);
                    }
                }
            }
        } else if constexpr (std::is_same_v<T, SessionStarted>) {
            auto line = std::format("session started for {} (pid {})", e.device_id, e.pid);
            device_log(e.device_id).write(line);
            system_log(line);
        } else if constexpr (std::is_same_v<T, SessionLog>) {
            device_log(e.device_id).write(e.line);
            if (auto notice = classifier_.feed(e.device_id, e.line)) {
                events_.emit(std::move(*notice));
            }
        } else if constexpr (std::is_same_v<T, SessionEnded>) {
            auto status = e.exit_code ? std::format("exit code {}", *e.exit_code)
                                      : std::string("no exit code");
            auto line = std::format("session ended for {} ({}, {}, {:.1f}s)", e.device_id,
                                    end_reason_name(e.reason), status, e.uptime_s);
            device_log(e.device_id).write(line);
            system_log(line);
            if (history_db_.is_open()) {
                history_db_.insert(e.device_id, e.args, e.uptime_s, e.exit_code,
                                   end_reason_name(e.reason));
            }
        } else if constexpr (std::is_same_v<T, TransferNotice>) {
            auto line = std::format("{} {} {}{}{}", transfer_kind_name(e.kind), e.path,
                                    e.success ? "succeeded" : "failed",
                                    e.detail.empty() ? "" : ": ", e.detail);
            device_log(e.device_id).write(line);
            system_log(e.device_id + ": " + line);
        } else {
            system_log(e.message);
        }
    }, event);
}

void DaemonCore::broadcast(const nlohmann::json& message) {
    std::vector<int> dead;
    for (int fd : subscribers_) {
        if (!ipc_.send_response(fd, message)) dead.push_back(fd);
    }
    for (int fd : dead) {
        log(std::format("Dropping subscriber fd {}", fd));
        remove_subscriber(fd);
    }
}

void DaemonCore::add_subscriber(int fd) {
    if (std::ranges::find(subscribers_, fd) == subscribers_.end()) {
        subscribers_.push_back(fd);
    }
}

void DaemonCore::remove_subscriber(int fd) {
    std::erase(subscribers_, fd);
}

LogBuffer& DaemonCore::device_log(const std::string& device_id) {
    return device_logs_.try_emplace(device_id, config_.logs.max_lines).first->second;
}

void DaemonCore::system_log(const std::string& line) {
    system_log_.write(line);
    log(line);
}

void DaemonCore::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    stop_watcher();
    registry_.shutdown(std::chrono::milliseconds(500));
    dispatch_events();
    history_db_.close();
    log("Shutdown complete");
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mirror-hub] {}", msg);
    }
}
