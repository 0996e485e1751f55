#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

struct DeviceConnected {
    std::set<std::string> devices;
};

struct DeviceDisconnected {
    std::set<std::string> devices;
};

struct SessionStarted {
    std::string device_id;
    int pid = 0;
};

struct SessionLog {
    std::string device_id;
    std::string line;
};

enum class EndReason { Exited, Stopped, Shutdown };

struct SessionEnded {
    std::string device_id;
    std::optional<int> exit_code; // empty when killed by a signal or status unknown
    EndReason reason = EndReason::Exited;
    double uptime_s = 0.0;
    std::vector<std::string> args;
};

enum class TransferKind { ApkInstall, FilePush };

struct TransferNotice {
    std::string device_id;
    TransferKind kind = TransferKind::ApkInstall;
    std::string path;
    bool success = false;
    std::string detail;
};

struct DiagnosticLog {
    std::string message;
};

using Event = std::variant<DeviceConnected, DeviceDisconnected, SessionStarted, SessionLog,
                           SessionEnded, TransferNotice, DiagnosticLog>;

const char* end_reason_name(EndReason reason);
const char* transfer_kind_name(TransferKind kind);

// Wire form pushed to subscribed IPC clients: {"event": <name>, ...}
nlohmann::json event_to_json(const Event& event);

// Delivery is best-effort. Implementations must be callable from any thread.
// emit may read registry state, but must not start or stop sessions itself;
// hand such work to another thread, as EventQueue does for the main loop.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(Event event) = 0;
};
