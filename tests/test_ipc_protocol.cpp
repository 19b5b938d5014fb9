#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/la_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Polls the non-blocking server until `count` messages arrived or the
// client hung up.
IpcServer::ReadStatus read_until(UnixSocketServer& server, int fd, std::vector<json>& cmds,
                                 size_t count) {
    for (int i = 0; i < 200 && cmds.size() < count; ++i) {
        auto status = server.read_commands(fd, cmds);
        if (status == IpcServer::ReadStatus::Closed) return status;
        if (cmds.size() < count) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return IpcServer::ReadStatus::Ok;
}

// Raw connection for writing bytes the client class never produces.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void write_all(int fd, const std::string& data) {
    REQUIRE(::send(fd, data.data(), data.size(), MSG_NOSIGNAL) ==
            static_cast<ssize_t>(data.size()));
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));

        struct stat st{};
        REQUIRE(::stat(sock_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);

        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"command", "status"}}));

        std::vector<json> cmds;
        REQUIRE(read_until(server, client_fd, cmds, 1) == IpcServer::ReadStatus::Ok);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["command"] == "status");

        REQUIRE(server.send_response(client_fd, {{"state", "idle"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["state"] == "idle");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("SeveralMessagesPerRead") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        write_all(raw, "{\"command\":\"status\"}\n{\"command\":\"listen\"}\n{\"command\":");

        std::vector<json> cmds;
        REQUIRE(read_until(server, client_fd, cmds, 2) == IpcServer::ReadStatus::Ok);
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[0]["command"] == "status");
        REQUIRE(cmds[1]["command"] == "listen");

        write_all(raw, "\"stop\"}\n");
        REQUIRE(read_until(server, client_fd, cmds, 3) == IpcServer::ReadStatus::Ok);
        REQUIRE(cmds.size() == 3);
        REQUIRE(cmds[2]["command"] == "stop");

        ::close(raw);
        server.stop();
    }

    SECTION("InvalidJsonBecomesNull") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        write_all(raw, "not json\n{\"command\":\"status\"}\n");

        std::vector<json> cmds;
        REQUIRE(read_until(server, client_fd, cmds, 2) == IpcServer::ReadStatus::Ok);
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[0].is_null());
        REQUIRE(cmds[1]["command"] == "status");

        ::close(raw);
        server.stop();
    }

    SECTION("StreamedEventsArriveInOrder") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(server.send_response(client_fd, {{"event", "transcript"}, {"seq", i}}));
        }

        for (int i = 0; i < 5; ++i) {
            json ev;
            REQUIRE(client.recv(ev, 1000));
            REQUIRE(ev["seq"] == i);
        }

        json none;
        REQUIRE_FALSE(client.recv(none, 20));

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        std::vector<json> cmds;
        REQUIRE(server.read_commands(client_fd, cmds) == IpcServer::ReadStatus::Closed);
        REQUIRE(cmds.empty());

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
    }
}
