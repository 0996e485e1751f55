#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                         Show watcher, devices and sessions");
    std::println(stderr, "  devices                        List devices seen by the watcher");
    std::println(stderr, "  sessions                       List devices with a running mirror");
    std::println(stderr, "  start <device> [-- args...]    Start mirroring a device");
    std::println(stderr, "  stop <device>                  Stop mirroring a device");
    std::println(stderr, "  watch-start                    Start the device watcher");
    std::println(stderr, "  watch-stop                     Stop the device watcher");
    std::println(stderr, "  logs [device] [--limit N]      Show buffered log lines");
    std::println(stderr, "  clear-logs                     Empty all log buffers");
    std::println(stderr, "  history [device] [--limit N]   Show finished sessions");
    std::println(stderr, "  watch                          Print daemon events until interrupted");
    std::println(stderr, "  shutdown                       Stop all sessions and exit the daemon");
}

static std::string join(const json& items) {
    std::string out;
    for (auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item.get<std::string>();
    }
    return out;
}

static void print_event(const json& ev) {
    auto name = ev.value("event", "");
    if (name == "device_connected") {
        std::println("+ {}", join(ev["devices"]));
    } else if (name == "device_disconnected") {
        std::println("- {}", join(ev["devices"]));
    } else if (name == "session_started") {
        std::println("[{}] started (pid {})", ev.value("device", ""), ev.value("pid", 0));
    } else if (name == "session_log") {
        std::println("[{}] {}", ev.value("device", ""), ev.value("line", ""));
    } else if (name == "session_ended") {
        auto code = ev["exit_code"].is_null() ? std::string("none")
                                              : std::to_string(ev["exit_code"].get<int>());
        std::println("[{}] ended ({}, exit code {})", ev.value("device", ""),
                     ev.value("reason", ""), code);
    } else if (name == "transfer") {
        std::println("[{}] {} {} {}{}", ev.value("device", ""), ev.value("kind", ""),
                     ev.value("path", ""), ev.value("success", false) ? "ok" : "failed",
                     ev.contains("detail") ? ": " + ev["detail"].get<std::string>() : "");
    } else if (name == "diagnostic") {
        std::println("! {}", ev.value("message", ""));
    } else {
        std::println("{}", ev.dump());
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::vector<std::string> passthrough;
    bool has_passthrough = false;
    int limit = -1;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (has_passthrough) {
            passthrough.push_back(arg);
        } else if (arg == "--") {
            has_passthrough = true;
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else {
            positional.push_back(arg);
        }
    }

    auto device_arg = [&]() -> std::string {
        return positional.empty() ? std::string() : positional.front();
    };

    json cmd;
    if (command == "status" || command == "devices" || command == "sessions" ||
        command == "shutdown") {
        cmd = {{"cmd", command}};
    } else if (command == "start" || command == "stop") {
        if (device_arg().empty()) {
            std::println(stderr, "{} needs a device id", command);
            return 1;
        }
        cmd = {{"cmd", command}, {"device", device_arg()}};
        if (command == "start" && has_passthrough) cmd["args"] = passthrough;
    } else if (command == "watch-start") {
        cmd = {{"cmd", "watch_start"}};
    } else if (command == "watch-stop") {
        cmd = {{"cmd", "watch_stop"}};
    } else if (command == "logs") {
        cmd = {{"cmd", "logs"}};
        if (!device_arg().empty()) cmd["device"] = device_arg();
        if (limit > 0) cmd["limit"] = limit;
    } else if (command == "clear-logs") {
        cmd = {{"cmd", "clear_logs"}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit > 0 ? limit : 10}};
        if (!device_arg().empty()) cmd["device"] = device_arg();
    } else if (command == "watch") {
        cmd = {{"cmd", "subscribe"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is mirror-hub running?");
        return 1;
    }

    json response;
    switch (client.request(cmd, response)) {
        case RecvStatus::Message:
            break;
        case RecvStatus::Timeout:
            std::println(stderr, "No response from daemon (timeout)");
            return 1;
        case RecvStatus::Closed:
            std::println(stderr, "Daemon closed the connection");
            return 1;
        case RecvStatus::Malformed:
            std::println(stderr, "Malformed response from daemon");
            return 1;
    }

    auto status = response.value("status", "");
    if (status == "error") {
        if (response.contains("code")) {
            std::println(stderr, "Error ({}): {}", response["code"].get<std::string>(),
                         response.value("message", "unknown error"));
        } else {
            std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        }
        return 1;
    }
    if (status != "ok") {
        std::println("{}", response.dump(2));
        return 1;
    }

    try {
        if (command == "status") {
            std::println("Watcher: {}", response.value("watcher", false) ? "running" : "stopped");
            std::println("Devices: {}", response["devices"].empty() ? "(none)"
                                                                    : join(response["devices"]));
            for (auto& s : response["sessions"]) {
                std::println("  {} {} pid={} uptime={:.1f}s", s.value("device", ""),
                             s.value("state", ""),
                             s.contains("pid") ? std::to_string(s["pid"].get<int>()) : "-",
                             s.value("uptime", 0.0));
            }
        } else if (command == "devices" || command == "sessions") {
            for (auto& d : response[command]) std::println("{}", d.get<std::string>());
        } else if (command == "stop") {
            std::println("{}", response.value("stopped", false) ? "Stopped" : "No session running");
        } else if (command == "logs") {
            for (auto& line : response["lines"]) std::println("{}", line.get<std::string>());
        } else if (command == "history") {
            for (auto& e : response["entries"]) {
                auto code = e["exit_code"].is_null() ? std::string("-")
                                                     : std::to_string(e["exit_code"].get<int>());
                std::println("[{}] {} {} {:.1f}s exit={} {}", e.value("timestamp", ""),
                             e.value("device", ""), e.value("reason", ""),
                             e.value("duration", 0.0), code, e.value("args", ""));
            }
        } else if (command == "watch") {
            json ev;
            for (auto rs = client.recv(ev, -1); rs != RecvStatus::Closed; rs = client.recv(ev, -1)) {
                if (rs == RecvStatus::Message) print_event(ev);
            }
            std::println(stderr, "Connection to daemon closed");
        } else {
            std::println("OK");
        }
    } catch (const json::exception& e) {
        std::println(stderr, "Malformed response from daemon: {}", e.what());
        return 1;
    }

    return 0;
}
