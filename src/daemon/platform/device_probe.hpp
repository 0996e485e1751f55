#pragma once

#include <expected>
#include <string>
#include <vector>

class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;

    // Synchronous. Returns the identifiers of devices that are ready for use.
    virtual std::expected<std::vector<std::string>, std::string> enumerate_devices() = 0;
};
