#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <unordered_map>

// Listening AF_UNIX stream socket. Every socket it hands out is non-blocking
// and is driven from the daemon's epoll loop.
class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer() = default;
    ~UnixSocketServer() override { stop(); }

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return listen_fd_; }
    int accept_client() override;
    ReadResult read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    // Requests longer than this are treated as a protocol violation.
    static constexpr size_t kMaxRequestBytes = 64 * 1024;

    static ReadResult take_line(std::string& pending, nlohmann::json& cmd);

    int listen_fd_ = -1;
    std::string bound_path_;
    // Bytes received from each client that do not yet form a full line.
    std::unordered_map<int, std::string> pending_;
};
