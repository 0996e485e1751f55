#pragma once

#include "platform/process_launcher.hpp"

#include <string>

// Runs `<scrcpy> --serial=<device> <args...>` for each session.
class ScrcpyLauncher : public ProcessLauncher {
public:
    explicit ScrcpyLauncher(std::string scrcpy_path);

    std::expected<std::unique_ptr<ChildProcess>, std::string>
    spawn(const std::string& device_id, const LaunchSpec& spec) override;

    std::vector<std::string> command_line(const std::string& device_id,
                                          const LaunchSpec& spec) const;

private:
    std::string scrcpy_path_;
};
