#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Tools {
        std::string adb = "adb";
        std::string scrcpy = "scrcpy";
    } tools;

    struct Watcher {
        uint32_t poll_interval_ms = 2000;
        bool autostart = true;

        std::chrono::milliseconds poll_interval() const {
            return std::chrono::milliseconds(poll_interval_ms);
        }
    } watcher;

    struct Session {
        uint32_t supervise_interval_ms = 500;
        uint32_t stop_timeout_ms = 3000;
        std::vector<std::string> default_args;
        bool stop_on_disconnect = false;
    } session;

    struct Logs {
        size_t max_lines = 1000;
    } logs;

    static Config load(const std::string& path);
    static Config load_default();
};
