#pragma once

#include "platform/ipc_client.hpp"

#include <optional>
#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override { close(); }

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& msg) override;
    RecvStatus recv(nlohmann::json& msg, int timeout_ms = 30000) override;
    void close() override;

private:
    std::optional<std::string> take_line();

    int fd_ = -1;
    // Bytes received past the last returned message.
    std::string buf_;
};
