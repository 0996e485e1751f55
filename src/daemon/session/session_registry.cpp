#include "session/session_registry.hpp"

#include <exception>
#include <format>
#include <print>
#include <unistd.h>
#include <utility>

const char* session_errc_name(SessionErrc code) {
    switch (code) {
        case SessionErrc::AlreadyRunning: return "already_running";
        case SessionErrc::SpawnFailed: return "spawn_failed";
        case SessionErrc::StreamCaptureFailed: return "stream_capture_failed";
        case SessionErrc::ShuttingDown: return "shutting_down";
    }
    return "unknown";
}

SessionRegistry::SessionRegistry(ProcessLauncher& launcher, EventSink& sink,
                                 SessionOptions options)
    : launcher_(launcher), sink_(sink), options_(options), pump_(sink) {}

SessionRegistry::~SessionRegistry() {
    drain_and_terminate_all();
    if (supervisor_.joinable()) {
        supervisor_.request_stop();
        supervisor_.join();
    }
    pump_.stop();
}

bool SessionRegistry::init() {
    if (!pump_.start()) return false;
    if (!supervisor_.joinable()) {
        supervisor_ = std::jthread([this](std::stop_token st) { supervise(st); });
    }
    return true;
}

std::expected<void, SessionError> SessionRegistry::start(const std::string& device_id,
                                                         LaunchSpec spec) {
    std::shared_ptr<SessionController> controller;
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_) {
            return std::unexpected(SessionError{SessionErrc::ShuttingDown, "shutting down"});
        }
        if (sessions_.contains(device_id)) {
            return std::unexpected(SessionError{SessionErrc::AlreadyRunning,
                                                "session already running for " + device_id});
        }
        controller = std::make_shared<SessionController>(device_id, std::move(spec));
        sessions_.emplace(device_id, controller);
        spawns_in_flight_++;
    }

    // Drain waits on this count, so it must drop even if launch throws.
    struct InFlight {
        SessionRegistry& self;
        ~InFlight() {
            {
                std::lock_guard lock(self.mutex_);
                self.spawns_in_flight_--;
            }
            self.spawn_done_.notify_all();
        }
    } in_flight{*this};

    try {
        return launch(controller);
    } catch (...) {
        // Leave neither the placeholder nor an untracked process behind.
        remove_entry(device_id, controller.get());
        if (auto process = controller->request_stop()) {
            auto status = process->kill();
            controller->finish(status.exit_code);
            emit_ended(*controller, status.exit_code, EndReason::Stopped);
        }
        controller->abandon();
        throw;
    }
}

std::expected<void, SessionError> SessionRegistry::launch(
    const std::shared_ptr<SessionController>& controller) {
    const auto& device_id = controller->device_id();

    auto spawned = launcher_.spawn(device_id, controller->launch_spec());
    if (!spawned) {
        controller->abandon();
        remove_entry(device_id, controller.get());
        emit(DiagnosticLog{std::format("failed to start session for {}: {}", device_id,
                                       spawned.error())});
        return std::unexpected(SessionError{SessionErrc::SpawnFailed, spawned.error()});
    }

    auto process = std::move(*spawned);
    int out_fd = process->take_stdout();
    int err_fd = process->take_stderr();
    if (out_fd < 0 || err_fd < 0) {
        if (out_fd >= 0) ::close(out_fd);
        if (err_fd >= 0) ::close(err_fd);
        process->kill();
        controller->abandon();
        remove_entry(device_id, controller.get());
        auto msg = std::format("could not capture output of session for {}", device_id);
        emit(DiagnosticLog{msg});
        return std::unexpected(SessionError{SessionErrc::StreamCaptureFailed, msg});
    }

    int pid = process->pid();
    bool attached = controller->attach(std::move(process), [&](int running_pid) {
        emit(SessionStarted{device_id, running_pid});
    });
    if (!attached) {
        // A stop arrived during the spawn and already removed the entry.
        ::close(out_fd);
        ::close(err_fd);
        emit(DiagnosticLog{std::format("session for {} stopped while starting, killed pid {}",
                                       device_id, pid)});
        return {};
    }

    pump_.add_stream(device_id, out_fd);
    pump_.add_stream(device_id, err_fd);
    return {};
}

bool SessionRegistry::stop(const std::string& device_id) {
    std::shared_ptr<SessionController> controller;
    std::unique_ptr<ChildProcess> process;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(device_id);
        if (it == sessions_.end()) return false;
        controller = it->second;
        process = controller->request_stop();
        sessions_.erase(it);
    }

    // Still starting: the in-flight start kills its process when it tries to attach.
    if (!process) return true;

    auto status = process->terminate(options_.stop_timeout);
    controller->finish(status.exit_code);
    emit_ended(*controller, status.exit_code, EndReason::Stopped);
    return true;
}

std::set<std::string> SessionRegistry::snapshot() const {
    std::lock_guard lock(mutex_);
    std::set<std::string> running;
    for (const auto& [id, controller] : sessions_) {
        if (controller->state() == SessionState::Running) running.insert(id);
    }
    return running;
}

std::vector<SessionInfo> SessionRegistry::sessions() const {
    std::lock_guard lock(mutex_);
    std::vector<SessionInfo> out;
    out.reserve(sessions_.size());
    for (const auto& [id, c] : sessions_) {
        out.push_back({id, c->state(), c->pid(), c->uptime(), c->launch_spec().args});
    }
    return out;
}

void SessionRegistry::drain_and_terminate_all() {
    std::vector<std::pair<std::shared_ptr<SessionController>, std::unique_ptr<ChildProcess>>> running;
    {
        std::unique_lock lock(mutex_);
        shutting_down_ = true;
        for (auto& [id, controller] : sessions_) {
            if (auto process = controller->request_stop()) {
                running.emplace_back(controller, std::move(process));
            }
        }
        sessions_.clear();

        // A start between placeholder and attach kills its own process when
        // attach fails; wait for it so nothing outlives this call.
        spawn_done_.wait(lock, [this] { return spawns_in_flight_ == 0; });
    }

    for (auto& [controller, process] : running) {
        process->request_terminate();
    }
    for (auto& [controller, process] : running) {
        auto status = process->terminate(options_.stop_timeout);
        controller->finish(status.exit_code);
        emit_ended(*controller, status.exit_code, EndReason::Shutdown);
    }
}

void SessionRegistry::shutdown(std::chrono::milliseconds flush_timeout) {
    drain_and_terminate_all();
    if (supervisor_.joinable()) {
        supervisor_.request_stop();
        supervisor_.join();
    }
    if (!pump_.wait_idle(flush_timeout)) {
        std::println(stderr, "session: {} output stream(s) still open at shutdown",
                     pump_.active_streams());
    }
    pump_.stop();
}

void SessionRegistry::reap_exited() {
    std::vector<std::shared_ptr<SessionController>> controllers;
    {
        std::lock_guard lock(mutex_);
        controllers.reserve(sessions_.size());
        for (const auto& [id, controller] : sessions_) controllers.push_back(controller);
    }

    for (const auto& controller : controllers) {
        auto status = controller->poll_exit();
        if (!status) continue;

        remove_entry(controller->device_id(), controller.get());
        if (!status->exit_code && !status->term_signal) {
            emit(DiagnosticLog{"exit status unavailable for session " + controller->device_id()});
        } else if (status->term_signal) {
            emit(DiagnosticLog{std::format("session for {} killed by signal {}",
                                           controller->device_id(), *status->term_signal)});
        }
        emit_ended(*controller, status->exit_code, EndReason::Exited);
    }
}

void SessionRegistry::supervise(std::stop_token st) {
    while (!st.stop_requested()) {
        {
            std::unique_lock lock(tick_mutex_);
            tick_.wait_for(lock, st, options_.supervise_interval, [] { return false; });
        }
        if (st.stop_requested()) break;
        reap_exited();
    }
}

void SessionRegistry::remove_entry(const std::string& device_id,
                                   const SessionController* controller) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(device_id);
    // The entry may already belong to a newer session for the same device.
    if (it != sessions_.end() && it->second.get() == controller) {
        sessions_.erase(it);
    }
}

void SessionRegistry::emit_ended(const SessionController& controller,
                                 std::optional<int> exit_code, EndReason reason) {
    controller.wait_announced();
    emit(SessionEnded{
        .device_id = controller.device_id(),
        .exit_code = exit_code,
        .reason = reason,
        .uptime_s = controller.uptime(),
        .args = controller.launch_spec().args,
    });
}

void SessionRegistry::emit(Event event) {
    try {
        sink_.emit(std::move(event));
    } catch (const std::exception& e) {
        std::println(stderr, "session: event delivery failed: {}", e.what());
    }
}
