#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, std::string config_path, bool verbose)
    : config_(std::move(config)), config_path_(std::move(config_path)), verbose_(verbose),
      window_mgr_(config_.reconnect.command_timeout()),
      cursor_query_(config_.cursor.command),
      core_(config_, verbose_, DaemonCore::Paths::defaults(),
            window_mgr_, cursor_query_, detector_,
            // ScheduleReconnect
            [this](std::chrono::milliseconds delay) { arm_reconnect_timer(delay); }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool LinuxEventLoop::init() {
    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Reconnect backoff timer; must exist before the core can schedule anything.
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    core_.init();

    // Handshake, subscribe, snapshot and recovery, all before the first event is read.
    if (auto started = core_.start(); !started) {
        std::println(stderr, "sway: {}", started.error().message);
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(timer_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }
    sync_wm_fd();

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) != sizeof(info)) continue;
                if (info.ssi_signo == SIGHUP) {
                    reload_config();
                    continue;
                }
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                if (::read(timer_fd_, &expirations, sizeof(expirations)) != sizeof(expirations)) continue;
                core_.on_reconnect_timer();
                sync_wm_fd();
                continue;
            }

            if (fd == wm_fd_) {
                core_.on_wm_readable();
                sync_wm_fd();
                continue;
            }

            // Anything else must be a client; stale entries for an event socket
            // closed earlier in this batch are skipped.
            if (ipc_server_.has_client(fd)) {
                handle_client(fd);
                sync_wm_fd();
            }
        }
    }

    // Clean shutdown
    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<IpcServer::Request> requests;
    bool open = ipc_server_.read_requests(fd, requests);

    for (auto& req : requests) {
        nlohmann::json response;
        if (req) {
            response = core_.handle_command(req->value("cmd", ""), *req);
        } else {
            response = {{"status", "error"}, {"message", req.error().message}, {"retryable", false}};
        }
        if (!ipc_server_.send_response(fd, response)) {
            open = false;
            break;
        }
    }

    if (!open) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        ipc_server_.close_client(fd);
    }
}

void LinuxEventLoop::reload_config() {
    log("SIGHUP: reloading configuration");
    config_ = config_path_.empty() ? Config::load_default(config_)
                                   : Config::load(config_path_, config_);

    window_mgr_.set_command_timeout(config_.reconnect.command_timeout());
    cursor_query_.set_command(config_.cursor.command);
    core_.apply_config(config_);
    sync_wm_fd();
}

void LinuxEventLoop::arm_reconnect_timer(std::chrono::milliseconds delay) {
    auto ms = std::max<int64_t>(delay.count(), 1);  // a zero it_value would disarm the timer
    itimerspec spec{};
    spec.it_value.tv_sec = static_cast<time_t>(ms / 1000);
    spec.it_value.tv_nsec = static_cast<long>((ms % 1000) * 1000000);
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::sync_wm_fd() {
    int fd = window_mgr_.event_fd();
    if (fd == wm_fd_) return;

    // The old event socket was closed, which already took it out of the
    // epoll set; its number may belong to someone else by now.
    wm_fd_ = -1;

    if (fd >= 0) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) {
            wm_fd_ = fd;
        } else {
            std::println(stderr, "epoll_ctl (sway events) failed: {}", std::strerror(errno));
        }
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[i3pm] {}", msg);
    }
}
