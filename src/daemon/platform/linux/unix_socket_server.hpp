#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    // A client whose request line grows past this is dropped.
    static constexpr size_t MAX_REQUEST_BYTES = 1 << 20;

    explicit UnixSocketServer(size_t max_request_bytes = MAX_REQUEST_BYTES);
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    bool has_client(int client_fd) const override;
    bool read_requests(int client_fd, std::vector<Request>& requests) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    bool take_lines(std::string& pending, std::vector<Request>& requests) const;

    size_t max_request_bytes_;
    int server_fd_ = -1;
    std::string socket_path_;

    struct Connection {
        int fd;
        std::string pending;  // bytes after the last newline
    };
    std::vector<Connection> clients_;

    Connection* find_client(int fd);
};
