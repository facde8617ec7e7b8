#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer(size_t max_request_bytes)
    : max_request_bytes_(max_request_bytes) {}

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& socket_path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long");
        return false;
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    std::error_code ec;
    auto parent = std::filesystem::path(socket_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    // Remove stale socket
    ::unlink(socket_path.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 8) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        ::unlink(socket_path.c_str());
        return false;
    }

    socket_path_ = socket_path;
    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

bool UnixSocketServer::has_client(int client_fd) const {
    return std::ranges::any_of(clients_, [client_fd](const Connection& c) { return c.fd == client_fd; });
}

bool UnixSocketServer::read_requests(int client_fd, std::vector<Request>& requests) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    char buf[4096];
    for (;;) {
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            client->pending.append(buf, static_cast<size_t>(n));
            // Checked per chunk, so a client that never stops writing is cut off early.
            if (!take_lines(client->pending, requests)) return false;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        // EOF or error. Complete lines received so far were already handed out.
        return false;
    }
}

bool UnixSocketServer::take_lines(std::string& pending, std::vector<Request>& requests) const {
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
        if (pos > max_request_bytes_) return false;
        std::string line = pending.substr(0, pos);
        pending.erase(0, pos + 1);
        if (line.empty()) continue;

        try {
            auto cmd = nlohmann::json::parse(line);
            if (!cmd.is_object()) {
                requests.push_back(std::unexpected(Error{ErrorKind::Protocol, "request must be a JSON object"}));
                continue;
            }
            requests.push_back(std::move(cmd));
        } catch (const nlohmann::json::exception& e) {
            requests.push_back(std::unexpected(Error{ErrorKind::Protocol,
                                                     std::format("malformed request: {}", e.what())}));
        }
    }
    return pending.size() <= max_request_bytes_;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";

    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = ::send(client_fd, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n >= 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            // Large dumps can outrun the socket buffer; wait briefly for the reader.
            pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
            if (::poll(&pfd, 1, 1000) > 0) continue;
        }
        return false;
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const Connection& c) { return c.fd == client_fd; });
}

UnixSocketServer::Connection* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const Connection& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
