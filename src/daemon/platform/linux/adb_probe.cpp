#include "platform/linux/adb_probe.hpp"

#include "device/adb_device_list.hpp"
#include "platform/linux/posix_process.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <unistd.h>

namespace {

// Read both pipes to EOF. Polling both keeps a chatty stderr from stalling adb.
std::expected<void, std::string> read_both(int out_fd, int err_fd,
                                           std::string& out, std::string& err) {
    pollfd fds[2] = {
        {.fd = out_fd, .events = POLLIN, .revents = 0},
        {.fd = err_fd, .events = POLLIN, .revents = 0},
    };
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;

    while (open_count > 0) {
        int n = ::poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("poll() failed: ") + std::strerror(errno));
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            char buf[4096];
            ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
            if (r < 0 && errno == EINTR) continue;
            if (r < 0) {
                return std::unexpected(std::string("read() failed: ") + std::strerror(errno));
            }
            if (r == 0) {
                fds[i].fd = -1; // poll ignores negative fds
                open_count--;
                continue;
            }
            sinks[i]->append(buf, static_cast<size_t>(r));
        }
    }
    return {};
}

} // namespace

AdbProbe::AdbProbe(std::string adb_path) : adb_path_(std::move(adb_path)) {}

std::expected<std::vector<std::string>, std::string> AdbProbe::enumerate_devices() {
    auto process = PosixProcess::spawn({adb_path_, "devices"});
    if (!process) {
        return std::unexpected(std::format("failed to execute {}: {}", adb_path_, process.error()));
    }

    int out_fd = (*process)->take_stdout();
    int err_fd = (*process)->take_stderr();
    std::string out, err;
    auto read_result = read_both(out_fd, err_fd, out, err);
    ::close(out_fd);
    ::close(err_fd);

    auto status = read_result ? (*process)->wait() : (*process)->kill();
    if (!read_result) return std::unexpected(read_result.error());

    if (status.exit_code != 0) {
        while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) err.pop_back();
        return std::unexpected(std::format("{} devices exited with {}{}{}", adb_path_,
                                           status.exit_code ? std::to_string(*status.exit_code)
                                                            : std::string("a signal"),
                                           err.empty() ? "" : ": ", err));
    }

    return parse_adb_devices(out);
}
