#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/procfs_detector.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/xdotool_cursor_query.hpp"

#include <atomic>
#include <chrono>
#include <string>

class LinuxEventLoop {
public:
    // `config_path` is re-read on SIGHUP; empty means the default location.
    LinuxEventLoop(Config config, std::string config_path, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void reload_config();
    void arm_reconnect_timer(std::chrono::milliseconds delay);
    void sync_wm_fd();
    void log(const std::string& msg);

    Config config_;
    std::string config_path_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    SwayWindowManager window_mgr_;
    XdotoolCursorQuery cursor_query_;
    ProcfsDetector detector_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;
    int wm_fd_ = -1;  // event socket currently registered with epoll

    std::atomic<bool> running_{false};
};
