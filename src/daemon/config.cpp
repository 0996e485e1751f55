#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    // Parse into a scratch copy so a type error halfway through leaves pure defaults.
    try {
        auto j = json::parse(f);
        Config parsed;

        if (j.contains("tools")) {
            auto& t = j["tools"];
            if (t.contains("adb")) parsed.tools.adb = t["adb"].get<std::string>();
            if (t.contains("scrcpy")) parsed.tools.scrcpy = t["scrcpy"].get<std::string>();
        }

        if (j.contains("watcher")) {
            auto& w = j["watcher"];
            if (w.contains("poll_interval_ms"))
                parsed.watcher.poll_interval_ms = w["poll_interval_ms"].get<uint32_t>();
            if (w.contains("autostart")) parsed.watcher.autostart = w["autostart"].get<bool>();
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            if (s.contains("supervise_interval_ms"))
                parsed.session.supervise_interval_ms = s["supervise_interval_ms"].get<uint32_t>();
            if (s.contains("stop_timeout_ms"))
                parsed.session.stop_timeout_ms = s["stop_timeout_ms"].get<uint32_t>();
            if (s.contains("default_args"))
                parsed.session.default_args = s["default_args"].get<std::vector<std::string>>();
            if (s.contains("stop_on_disconnect"))
                parsed.session.stop_on_disconnect = s["stop_on_disconnect"].get<bool>();
        }

        if (j.contains("logs")) {
            auto& l = j["logs"];
            if (l.contains("max_lines")) parsed.logs.max_lines = l["max_lines"].get<size_t>();
        }

        if (parsed.watcher.poll_interval_ms == 0) {
            std::println(stderr, "config: watcher.poll_interval_ms must be positive, using 2000");
            parsed.watcher.poll_interval_ms = 2000;
        }
        if (parsed.session.supervise_interval_ms == 0) {
            std::println(stderr, "config: session.supervise_interval_ms must be positive, using 500");
            parsed.session.supervise_interval_ms = 500;
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        return load(config_path.string());
    }
    return Config{};
}
