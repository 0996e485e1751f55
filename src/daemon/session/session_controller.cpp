#include "session/session_controller.hpp"

#include <type_traits>
#include <utility>

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Starting: return "starting";
        case SessionState::Running: return "running";
        case SessionState::StopRequested: return "stopping";
        case SessionState::Terminated: return "terminated";
    }
    return "unknown";
}

SessionController::SessionController(std::string device_id, LaunchSpec spec)
    : device_id_(std::move(device_id)), spec_(std::move(spec)) {}

bool SessionController::attach(std::unique_ptr<ChildProcess> process,
                               const RunningCallback& on_running) {
    std::lock_guard announce(announce_mutex_);
    int pid = process->pid();
    {
        std::lock_guard lock(mutex_);
        if (!std::holds_alternative<Starting>(phase_)) {
            // Stop won the race: the placeholder was claimed during the spawn.
            phase_ = Terminated{};
        } else {
            pid_ = pid;
            running_since_ = std::chrono::steady_clock::now();
            phase_ = Running{std::move(process)};
        }
    }
    // Still owned here only if the stop won; Running took it otherwise.
    if (process) {
        process->kill();
        return false;
    }
    if (on_running) on_running(pid);
    return true;
}

void SessionController::wait_announced() const {
    std::lock_guard announce(announce_mutex_);
}

void SessionController::abandon() {
    std::lock_guard lock(mutex_);
    if (std::holds_alternative<Starting>(phase_) ||
        std::holds_alternative<StopRequested>(phase_)) {
        phase_ = Terminated{};
    }
}

std::unique_ptr<ChildProcess> SessionController::request_stop() {
    std::lock_guard lock(mutex_);
    if (std::holds_alternative<Terminated>(phase_)) return nullptr;

    auto previous = std::exchange(phase_, StopRequested{});
    if (auto* running = std::get_if<Running>(&previous)) {
        mark_ended();
        return std::move(running->process);
    }
    return nullptr;
}

void SessionController::finish(std::optional<int> exit_code) {
    std::lock_guard lock(mutex_);
    if (std::holds_alternative<StopRequested>(phase_)) {
        phase_ = Terminated{exit_code};
    }
}

std::optional<ExitStatus> SessionController::poll_exit() {
    std::lock_guard lock(mutex_);
    auto* running = std::get_if<Running>(&phase_);
    if (!running) return std::nullopt;

    ExitStatus status;
    auto polled = running->process->poll_exit();
    if (polled) {
        if (!polled->has_value()) return std::nullopt; // still alive
        status = **polled;
    }

    // The process handle is released together with the Running phase.
    auto ended = std::exchange(phase_, Terminated{status.exit_code});
    mark_ended();
    return status;
}

SessionState SessionController::state() const {
    std::lock_guard lock(mutex_);
    return std::visit([](const auto& phase) {
        using T = std::decay_t<decltype(phase)>;
        if constexpr (std::is_same_v<T, Starting>) return SessionState::Starting;
        else if constexpr (std::is_same_v<T, Running>) return SessionState::Running;
        else if constexpr (std::is_same_v<T, StopRequested>) return SessionState::StopRequested;
        else return SessionState::Terminated;
    }, phase_);
}

std::optional<int> SessionController::pid() const {
    std::lock_guard lock(mutex_);
    if (!std::holds_alternative<Running>(phase_)) return std::nullopt;
    return pid_;
}

std::optional<int> SessionController::exit_code() const {
    std::lock_guard lock(mutex_);
    if (auto* t = std::get_if<Terminated>(&phase_)) return t->exit_code;
    return std::nullopt;
}

double SessionController::uptime() const {
    std::lock_guard lock(mutex_);
    if (!pid_) return 0.0;
    auto end = running_until_.value_or(std::chrono::steady_clock::now());
    return std::chrono::duration<double>(end - running_since_).count();
}

void SessionController::mark_ended() {
    if (!running_until_) running_until_ = std::chrono::steady_clock::now();
}
