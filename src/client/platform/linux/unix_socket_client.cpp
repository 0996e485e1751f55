#include "platform/linux/unix_socket_client.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

bool UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& msg) {
    if (fd_ < 0) return false;
    std::string line = msg.dump() + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t sent = ::send(fd_, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

std::optional<std::string> UnixSocketClient::take_line() {
    auto pos = buf_.find('\n');
    if (pos == std::string::npos) return std::nullopt;
    std::string line = buf_.substr(0, pos);
    buf_.erase(0, pos + 1);
    return line;
}

RecvStatus UnixSocketClient::recv(nlohmann::json& msg, int timeout_ms) {
    if (fd_ < 0) return RecvStatus::Closed;

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        if (auto line = take_line()) {
            try {
                msg = nlohmann::json::parse(*line);
                return RecvStatus::Message;
            } catch (const nlohmann::json::exception&) {
                return RecvStatus::Malformed;
            }
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            wait_ms = static_cast<int>(std::max<int64_t>(left.count(), 0));
        }

        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) return RecvStatus::Closed;
        if (ret == 0) return RecvStatus::Timeout;

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return RecvStatus::Closed;

        buf_.append(tmp, static_cast<size_t>(n));
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}
