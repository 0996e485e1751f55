#include "device/adb_device_list.hpp"

#include <sstream>

namespace {

constexpr std::string_view kHeader = "List of devices attached";
constexpr std::string_view kReadyState = "device";

std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

} // namespace

std::vector<std::string> parse_adb_devices(std::string_view output) {
    std::vector<std::string> devices;

    size_t start = 0;
    while (start <= output.size()) {
        size_t end = output.find('\n', start);
        if (end == std::string_view::npos) end = output.size();
        auto line = trim(output.substr(start, end - start));
        start = end + 1;

        if (line.empty() || line == kHeader || line.front() == '*') continue;

        std::istringstream fields{std::string(line)};
        std::string serial, state;
        if (!(fields >> serial >> state)) continue;
        if (state == kReadyState) {
            devices.push_back(std::move(serial));
        }
    }

    return devices;
}
