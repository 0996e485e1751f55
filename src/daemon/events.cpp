#include "events.hpp"

#include <type_traits>

const char* end_reason_name(EndReason reason) {
    switch (reason) {
        case EndReason::Exited: return "exited";
        case EndReason::Stopped: return "stopped";
        case EndReason::Shutdown: return "shutdown";
    }
    return "unknown";
}

const char* transfer_kind_name(TransferKind kind) {
    switch (kind) {
        case TransferKind::ApkInstall: return "apk_install";
        case TransferKind::FilePush: return "file_push";
    }
    return "unknown";
}

nlohmann::json event_to_json(const Event& event) {
    return std::visit([](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, DeviceConnected>) {
            return {{"event", "device_connected"}, {"devices", e.devices}};
        } else if constexpr (std::is_same_v<T, DeviceDisconnected>) {
            return {{"event", "device_disconnected"}, {"devices", e.devices}};
        } else if constexpr (std::is_same_v<T, SessionStarted>) {
            return {{"event", "session_started"}, {"device", e.device_id}, {"pid", e.pid}};
        } else if constexpr (std::is_same_v<T, SessionLog>) {
            return {{"event", "session_log"}, {"device", e.device_id}, {"line", e.line}};
        } else if constexpr (std::is_same_v<T, SessionEnded>) {
            nlohmann::json j = {
                {"event", "session_ended"},
                {"device", e.device_id},
                {"exit_code", nullptr},
                {"reason", end_reason_name(e.reason)},
                {"uptime", e.uptime_s},
            };
            if (e.exit_code) j["exit_code"] = *e.exit_code;
            return j;
        } else if constexpr (std::is_same_v<T, TransferNotice>) {
            nlohmann::json j = {
                {"event", "transfer"},
                {"device", e.device_id},
                {"kind", transfer_kind_name(e.kind)},
                {"path", e.path},
                {"success", e.success},
            };
            if (!e.detail.empty()) j["detail"] = e.detail;
            return j;
        } else {
            return {{"event", "diagnostic"}, {"message", e.message}};
        }
    }, event);
}
