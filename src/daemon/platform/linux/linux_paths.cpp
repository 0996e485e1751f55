#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* kAppName = "mirror-hub";

// XDG variables that are unset, empty or relative are ignored.
std::string xdg_base(const char* var, const char* home_fallback) {
    const char* xdg = std::getenv(var);
    if (xdg && xdg[0] == '/') return xdg;
    const char* home = std::getenv("HOME");
    if (!home || !home[0]) return {};
    return std::string(home) + home_fallback;
}

} // namespace

std::string config_dir() {
    auto base = xdg_base("XDG_CONFIG_HOME", "/.config");
    return base.empty() ? base : base + "/" + kAppName;
}

std::string data_dir() {
    auto base = xdg_base("XDG_DATA_HOME", "/.local/share");
    return base.empty() ? base : base + "/" + kAppName;
}

std::string history_db_path() {
    auto dir = data_dir();
    if (dir.empty()) dir = std::string("/tmp/") + kAppName;
    return dir + "/sessions.db";
}

std::string ipc_endpoint() {
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    std::string dir = (runtime && runtime[0] == '/') ? runtime : "/tmp";
    return dir + "/" + kAppName + ".sock";
}

} // namespace platform
