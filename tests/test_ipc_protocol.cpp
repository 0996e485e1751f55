#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/mh_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Server sockets are non-blocking; retry until something other than Incomplete.
ReadResult read_wait(UnixSocketServer& server, int fd, json& out) {
    ReadResult r = ReadResult::Incomplete;
    for (int i = 0; i < 200 && r == ReadResult::Incomplete; ++i) {
        r = server.read_command(fd, out);
        if (r == ReadResult::Incomplete) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return r;
}

int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("StaleSocketReplaced") {
        // A crashed daemon leaves its bound socket file behind.
        int stale = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        REQUIRE(stale >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::bind(stale, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        ::close(stale);
        REQUIRE(std::filesystem::exists(sock_path));

        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        server.stop();
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = -1;
        for (int i = 0; i < 100 && client_fd < 0; ++i) {
            client_fd = server.accept_client();
            if (client_fd < 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "status"}}));

        json received;
        REQUIRE(read_wait(server, client_fd, received) == ReadResult::Command);
        REQUIRE(received["cmd"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}}));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000) == RecvStatus::Message);
        REQUIRE(client_resp["status"] == "ok");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("SeveralCommandsInOneWrite") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string batch = "{\"seq\":0}\n{\"seq\":1}\n{\"seq\":";
        REQUIRE(::send(raw, batch.data(), batch.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(batch.size()));

        json a, b, c;
        REQUIRE(read_wait(server, client_fd, a) == ReadResult::Command);
        REQUIRE(read_wait(server, client_fd, b) == ReadResult::Command);
        REQUIRE(a["seq"] == 0);
        REQUIRE(b["seq"] == 1);

        // The third request is still partial.
        REQUIRE(server.read_command(client_fd, c) == ReadResult::Incomplete);
        std::string rest = "2}\n";
        REQUIRE(::send(raw, rest.data(), rest.size(), MSG_NOSIGNAL) == 3);
        REQUIRE(read_wait(server, client_fd, c) == ReadResult::Command);
        REQUIRE(c["seq"] == 2);

        ::close(raw);
        server.stop();
    }

    SECTION("MultipleResponsesOnOneConnection") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(server.send_response(client_fd, {{"event", "session_log"}, {"seq", i}}));
        }
        for (int i = 0; i < 5; ++i) {
            json ev;
            REQUIRE(client.recv(ev, 1000) == RecvStatus::Message);
            REQUIRE(ev["seq"] == i);
        }

        server.stop();
    }

    SECTION("InvalidJson") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string junk = "not json\n{\"cmd\":\"status\"}\n";
        REQUIRE(::send(raw, junk.data(), junk.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(junk.size()));

        json cmd;
        REQUIRE(read_wait(server, client_fd, cmd) == ReadResult::Invalid);
        // The connection stays usable after a bad line.
        REQUIRE(read_wait(server, client_fd, cmd) == ReadResult::Command);
        REQUIRE(cmd["cmd"] == "status");

        ::close(raw);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Closed);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientRecvOutcomes") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = -1;
        for (int i = 0; i < 100 && client_fd < 0; ++i) {
            client_fd = server.accept_client();
            if (client_fd < 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        REQUIRE(client_fd >= 0);

        json msg;
        REQUIRE(client.recv(msg, 20) == RecvStatus::Timeout);

        std::string raw = "not json\n{\"event\":\"diagnostic\"}\n";
        REQUIRE(::send(client_fd, raw.data(), raw.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(raw.size()));
        REQUIRE(client.recv(msg, 1000) == RecvStatus::Malformed);
        REQUIRE(client.recv(msg, 1000) == RecvStatus::Message);
        REQUIRE(msg["event"] == "diagnostic");

        server.close_client(client_fd);
        REQUIRE(client.recv(msg, 1000) == RecvStatus::Closed);
        server.stop();
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path + ".missing"));
        REQUIRE_FALSE(client.send({{"cmd", "status"}}));
    }
}
