#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_server.hpp"
#include "sway/ipc_protocol.hpp"

#include <array>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/i3pm_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Blocking AF_UNIX client speaking raw bytes, so tests control line boundaries.
struct RawClient {
    int fd = -1;

    explicit RawClient(const std::string& path) {
        fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(fd);
            fd = -1;
        }
    }

    ~RawClient() { close(); }

    void close() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }

    bool write(const std::string& data) const {
        return ::send(fd, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
    }

    std::string read_line(int timeout_ms = 1000) const {
        std::string line;
        char c;
        while (true) {
            pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
            if (::poll(&pfd, 1, timeout_ms) <= 0) return line;
            if (::recv(fd, &c, 1, 0) != 1) return line;
            if (c == '\n') return line;
            line += c;
        }
    }
};

// Reads until `want` requests arrived or the client went away.
bool drain(UnixSocketServer& server, int client_fd, std::vector<IpcServer::Request>& out, size_t want) {
    for (int i = 0; i < 100; ++i) {
        bool open = server.read_requests(client_fd, out);
        if (out.size() >= want || !open) return open;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

} // namespace

TEST_CASE("i3-ipc framing", "[ipc]") {

    SECTION("EncodeHeaderLayout") {
        auto frame = encode_frame(ipc_msg::GET_TREE, "");
        REQUIRE(frame.size() == IPC_HEADER_LEN);
        REQUIRE(frame.compare(0, 6, "i3-ipc") == 0);

        std::array<char, IPC_HEADER_LEN> hdr{};
        std::memcpy(hdr.data(), frame.data(), IPC_HEADER_LEN);
        auto h = decode_header(hdr);
        REQUIRE(h.has_value());
        REQUIRE(h->length == 0);
        REQUIRE(h->type == ipc_msg::GET_TREE);
        REQUIRE_FALSE(h->is_event());
    }

    SECTION("PayloadFollowsHeader") {
        std::string payload = R"(["window","shutdown"])";
        auto frame = encode_frame(ipc_msg::SUBSCRIBE, payload);
        REQUIRE(frame.size() == IPC_HEADER_LEN + payload.size());
        REQUIRE(frame.substr(IPC_HEADER_LEN) == payload);

        std::array<char, IPC_HEADER_LEN> hdr{};
        std::memcpy(hdr.data(), frame.data(), IPC_HEADER_LEN);
        REQUIRE(decode_header(hdr)->length == payload.size());
    }

    SECTION("EventBit") {
        auto frame = encode_frame(ipc_msg::EVENT_SHUTDOWN, "{}");
        std::array<char, IPC_HEADER_LEN> hdr{};
        std::memcpy(hdr.data(), frame.data(), IPC_HEADER_LEN);
        REQUIRE(decode_header(hdr)->is_event());
    }

    SECTION("BadMagic") {
        auto frame = encode_frame(ipc_msg::GET_TREE, "");
        frame[0] = 'x';
        std::array<char, IPC_HEADER_LEN> hdr{};
        std::memcpy(hdr.data(), frame.data(), IPC_HEADER_LEN);
        REQUIRE(decode_header(hdr).error().kind == ErrorKind::Protocol);
    }

    SECTION("OversizedPayload") {
        auto frame = encode_frame(ipc_msg::GET_TREE, "");
        uint32_t huge = IPC_MAX_PAYLOAD + 1;
        std::memcpy(frame.data() + 6, &huge, 4);
        std::array<char, IPC_HEADER_LEN> hdr{};
        std::memcpy(hdr.data(), frame.data(), IPC_HEADER_LEN);
        REQUIRE_FALSE(decode_header(hdr).has_value());
    }
}

TEST_CASE("UnixSocketServer", "[ipc]") {
    auto sock_path = tmp_socket_path();
    UnixSocketServer server;
    REQUIRE(server.start(sock_path));

    SECTION("StartStop") {
        REQUIRE(std::filesystem::exists(sock_path));
        REQUIRE(server.server_fd() >= 0);
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RoundTrip") {
        RawClient client(sock_path);
        REQUIRE(client.fd >= 0);
        int fd = server.accept_client();
        REQUIRE(fd >= 0);
        REQUIRE(server.has_client(fd));

        REQUIRE(client.write(R"({"cmd":"status"})" "\n"));
        std::vector<IpcServer::Request> requests;
        REQUIRE(drain(server, fd, requests, 1));
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].has_value());
        REQUIRE((*requests[0])["cmd"] == "status");

        REQUIRE(server.send_response(fd, {{"status", "ok"}, {"active_project", "nixos"}}));
        auto reply = json::parse(client.read_line());
        REQUIRE(reply["active_project"] == "nixos");

        server.close_client(fd);
        REQUIRE_FALSE(server.has_client(fd));
    }

    SECTION("PartialLinesAreBuffered") {
        RawClient client(sock_path);
        int fd = server.accept_client();
        REQUIRE(fd >= 0);

        REQUIRE(client.write(R"({"cmd":"sw)"));
        std::vector<IpcServer::Request> requests;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        REQUIRE(server.read_requests(fd, requests));
        REQUIRE(requests.empty());

        REQUIRE(client.write(R"(itch","project":"nixos"})" "\n"));
        REQUIRE(drain(server, fd, requests, 1));
        REQUIRE(requests.size() == 1);
        REQUIRE((*requests[0])["project"] == "nixos");
    }

    SECTION("SeveralLinesAndMalformedOnes") {
        RawClient client(sock_path);
        int fd = server.accept_client();
        REQUIRE(fd >= 0);

        REQUIRE(client.write("{\"cmd\":\"status\"}\nnot json\n[1,2]\n\n{\"cmd\":\"dump\"}\n"));
        std::vector<IpcServer::Request> requests;
        REQUIRE(drain(server, fd, requests, 4));
        REQUIRE(requests.size() == 4);
        REQUIRE(requests[0].has_value());
        REQUIRE(requests[1].error().kind == ErrorKind::Protocol);
        REQUIRE(requests[2].error().kind == ErrorKind::Protocol);
        REQUIRE((*requests[3])["cmd"] == "dump");
    }

    SECTION("RequestsBeforeHangupAreDelivered") {
        RawClient client(sock_path);
        int fd = server.accept_client();
        REQUIRE(fd >= 0);

        REQUIRE(client.write("{\"cmd\":\"recover\"}\n"));
        client.close();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        std::vector<IpcServer::Request> requests;
        REQUIRE_FALSE(server.read_requests(fd, requests));
        REQUIRE(requests.size() == 1);
        REQUIRE((*requests[0])["cmd"] == "recover");
        server.close_client(fd);
    }

    SECTION("OverlongRequestDropsClientBeforeReadingOn") {
        auto bounded_path = tmp_socket_path() + ".bounded";
        UnixSocketServer bounded(64);
        REQUIRE(bounded.start(bounded_path));

        RawClient client(bounded_path);
        int fd = bounded.accept_client();
        REQUIRE(fd >= 0);

        REQUIRE(client.write(std::string(200, 'x') + "\n{\"cmd\":\"status\"}\n"));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        std::vector<IpcServer::Request> requests;
        REQUIRE_FALSE(bounded.read_requests(fd, requests));
        REQUIRE(requests.empty());
        bounded.close_client(fd);
        bounded.stop();
    }

    SECTION("UnknownClient") {
        std::vector<IpcServer::Request> requests;
        REQUIRE_FALSE(server.read_requests(12345, requests));
        REQUIRE_FALSE(server.has_client(12345));
    }

    server.stop();
}
