#pragma once

#include "platform/device_probe.hpp"

#include <string>

// Enumerates devices by running `<adb> devices` and parsing its output.
class AdbProbe : public DeviceProbe {
public:
    explicit AdbProbe(std::string adb_path);

    std::expected<std::vector<std::string>, std::string> enumerate_devices() override;

private:
    std::string adb_path_;
};
