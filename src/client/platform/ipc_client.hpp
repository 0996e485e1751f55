#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class RecvStatus {
    Message,   // msg holds one parsed line
    Timeout,
    Closed,    // daemon hung up or the socket failed
    Malformed, // a line arrived that was not JSON; it has been consumed
};

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& msg) = 0;
    // Next newline-delimited message. timeout_ms < 0 waits indefinitely.
    virtual RecvStatus recv(nlohmann::json& msg, int timeout_ms = 30000) = 0;
    virtual void close() = 0;

    RecvStatus request(const nlohmann::json& cmd, nlohmann::json& response,
                       int timeout_ms = 30000) {
        if (!send(cmd)) return RecvStatus::Closed;
        return recv(response, timeout_ms);
    }
};
