#include "platform/linux/scrcpy_launcher.hpp"

#include "platform/linux/posix_process.hpp"

ScrcpyLauncher::ScrcpyLauncher(std::string scrcpy_path)
    : scrcpy_path_(std::move(scrcpy_path)) {}

std::vector<std::string> ScrcpyLauncher::command_line(const std::string& device_id,
                                                      const LaunchSpec& spec) const {
    std::vector<std::string> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(scrcpy_path_);
    argv.push_back("--serial=" + device_id);
    argv.insert(argv.end(), spec.args.begin(), spec.args.end());
    return argv;
}

std::expected<std::unique_ptr<ChildProcess>, std::string>
ScrcpyLauncher::spawn(const std::string& device_id, const LaunchSpec& spec) {
    auto process = PosixProcess::spawn(command_line(device_id, spec));
    if (!process) return std::unexpected(process.error());
    return std::unique_ptr<ChildProcess>(std::move(*process));
}
