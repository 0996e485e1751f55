#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // Remove stale socket
    if (::unlink(endpoint.c_str()) < 0 && errno != ENOENT) {
        std::println(stderr, "ipc: cannot remove stale {}: {}", endpoint, std::strerror(errno));
    }

    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    bound_path_ = endpoint;

    if (::listen(listen_fd_, 8) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (const auto& [fd, pending] : pending_) {
        ::close(fd);
    }
    pending_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    if (!bound_path_.empty()) {
        ::unlink(bound_path_.c_str());
        bound_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::println(stderr, "ipc: accept() failed: {}", std::strerror(errno));
        }
        return -1;
    }
    pending_.emplace(fd, std::string());
    return fd;
}

ReadResult UnixSocketServer::take_line(std::string& pending, nlohmann::json& cmd) {
    auto pos = pending.find('\n');
    if (pos == std::string::npos) return ReadResult::Incomplete;

    std::string line = pending.substr(0, pos);
    pending.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
        return ReadResult::Command;
    } catch (const nlohmann::json::exception&) {
        return ReadResult::Invalid;
    }
}

ReadResult UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto it = pending_.find(client_fd);
    if (it == pending_.end()) return ReadResult::Closed;
    auto& pending = it->second;

    // A previous recv may have delivered more than one line.
    auto buffered = take_line(pending, cmd);
    if (buffered != ReadResult::Incomplete) return buffered;

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n == 0) return ReadResult::Closed;
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return ReadResult::Incomplete;
        }
        return ReadResult::Closed;
    }

    pending.append(buf, static_cast<size_t>(n));
    auto result = take_line(pending, cmd);
    if (result == ReadResult::Incomplete && pending.size() > kMaxRequestBytes) {
        std::println(stderr, "ipc: request from fd {} exceeds {} bytes", client_fd,
                     kMaxRequestBytes);
        return ReadResult::Closed;
    }
    return result;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Slow reader: wait briefly for room rather than cutting a message in half.
                pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
                if (::poll(&pfd, 1, 1000) > 0) continue;
            }
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    pending_.erase(client_fd);
}
