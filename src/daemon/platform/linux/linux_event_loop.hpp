#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/adb_probe.hpp"
#include "platform/linux/scrcpy_launcher.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    AdbProbe probe_;
    ScrcpyLauncher launcher_;
    UnixSocketServer ipc_server_;

    // epoll; the eventfd must exist before core_ can notify through it
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    // Portable business logic
    DaemonCore core_;

    std::atomic<bool> running_{false};
};
