#pragma once

#include <string>
#include <string_view>
#include <vector>

// Parse `adb devices` output. Skips the header, blank lines and daemon
// start-up chatter ("* daemon started ..."); keeps only serials whose state is
// "device" (so "offline", "unauthorized", "recovery" etc. are left out).
std::vector<std::string> parse_adb_devices(std::string_view output);
