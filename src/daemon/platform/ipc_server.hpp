#pragma once

#include "errors.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Newline-delimited JSON requests from CLI clients, one JSON response each.
class IpcServer {
public:
    using Request = std::expected<nlohmann::json, Error>;

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual bool has_client(int client_fd) const = 0;

    // Reads what is available and appends every complete line to `requests`,
    // malformed ones as ErrorKind::Protocol. False once the client is gone;
    // requests appended by that last call should still be answered.
    virtual bool read_requests(int client_fd, std::vector<Request>& requests) = 0;

    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
