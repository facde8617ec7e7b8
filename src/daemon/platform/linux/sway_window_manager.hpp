#pragma once

#include "platform/window_manager.hpp"

#include <chrono>
#include <cstdint>
#include <string>

class SwayWindowManager : public WindowManager {
public:
    // An empty `socket_path` means $SWAYSOCK, then $I3SOCK, looked up on every connect().
    explicit SwayWindowManager(std::chrono::milliseconds command_timeout,
                               std::string socket_path = {});
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    std::expected<void, Error> connect() override;
    std::expected<void, Error> subscribe() override;
    void disconnect() override;
    bool connected() const override { return query_fd_ >= 0 && event_fd_ >= 0; }

    std::expected<TreeSnapshot, Error> snapshot() override;
    std::expected<void, Error> run_command(const std::string& command) override;

    int event_fd() const override { return event_fd_; }
    std::expected<WmEvent, Error> read_event() override;

    void set_command_timeout(std::chrono::milliseconds timeout);

private:
    struct Frame {
        uint32_t type = 0;
        std::string payload;
    };

    std::expected<void, Error> send_message(int fd, uint32_t type, const std::string& payload = "");
    std::expected<Frame, Error> recv_message(int fd);
    std::expected<std::string, Error> round_trip(uint32_t type, const std::string& payload = "");
    std::expected<int, Error> connect_socket(const std::string& path);
    void apply_timeout(int fd);

    std::chrono::milliseconds command_timeout_;
    std::string socket_override_;
    std::string sway_sock_;

    int query_fd_ = -1;  // GET_TREE, RUN_COMMAND etc.
    int event_fd_ = -1;  // subscribed events
};
