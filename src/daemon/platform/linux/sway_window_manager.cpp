#include "platform/linux/sway_window_manager.hpp"

#include "platform/platform_paths.hpp"
#include "sway/ipc_protocol.hpp"
#include "sway/tree_parser.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

constexpr const char* SUBSCRIPTIONS = R"(["window","workspace","output","shutdown"])";

Error io_error(const char* what) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return Error{ErrorKind::Timeout, std::format("sway: {} timed out", what)};
    }
    return Error{ErrorKind::TransientIo, std::format("sway: {} failed: {}", what, std::strerror(errno))};
}

} // namespace

SwayWindowManager::SwayWindowManager(std::chrono::milliseconds command_timeout,
                                     std::string socket_path)
    : command_timeout_(command_timeout), socket_override_(std::move(socket_path)) {}

SwayWindowManager::~SwayWindowManager() {
    disconnect();
}

std::expected<void, Error> SwayWindowManager::connect() {
    disconnect();

    sway_sock_ = socket_override_.empty() ? platform::wm_socket() : socket_override_;
    if (sway_sock_.empty()) {
        return std::unexpected(Error{ErrorKind::FatalHandshake, "sway: neither $SWAYSOCK nor $I3SOCK is set"});
    }

    auto fd = connect_socket(sway_sock_);
    if (!fd) return std::unexpected(fd.error());
    query_fd_ = *fd;
    apply_timeout(query_fd_);
    return {};
}

std::expected<void, Error> SwayWindowManager::subscribe() {
    if (query_fd_ < 0) {
        return std::unexpected(Error{ErrorKind::TransientIo, "sway: subscribe before connect"});
    }

    auto fd = connect_socket(sway_sock_);
    if (!fd) return std::unexpected(fd.error());
    event_fd_ = *fd;

    // Only the subscribe reply is read under the timeout; events are read when epoll says so.
    apply_timeout(event_fd_);

    auto fail = [this](Error e) -> std::expected<void, Error> {
        ::close(event_fd_);
        event_fd_ = -1;
        return std::unexpected(std::move(e));
    };

    if (auto sent = send_message(event_fd_, ipc_msg::SUBSCRIBE, SUBSCRIPTIONS); !sent) {
        return fail(sent.error());
    }

    auto reply = recv_message(event_fd_);
    if (!reply) return fail(reply.error());

    try {
        auto j = nlohmann::json::parse(reply->payload);
        if (!j.value("success", false)) {
            return fail(Error{ErrorKind::Protocol, "sway: subscription rejected"});
        }
    } catch (const nlohmann::json::exception& e) {
        return fail(Error{ErrorKind::Protocol, std::format("sway: bad subscribe reply: {}", e.what())});
    }

    timeval none{};
    ::setsockopt(event_fd_, SOL_SOCKET, SO_RCVTIMEO, &none, sizeof(none));
    return {};
}

void SwayWindowManager::disconnect() {
    if (query_fd_ >= 0) ::close(query_fd_);
    if (event_fd_ >= 0) ::close(event_fd_);
    query_fd_ = -1;
    event_fd_ = -1;
}

std::expected<TreeSnapshot, Error> SwayWindowManager::snapshot() {
    TreeSnapshot snap;

    auto tree = round_trip(ipc_msg::GET_TREE);
    if (!tree) return std::unexpected(tree.error());
    auto windows = parse_tree(*tree);
    if (!windows) return std::unexpected(windows.error());
    snap.windows = std::move(*windows);

    auto ws = round_trip(ipc_msg::GET_WORKSPACES);
    if (!ws) return std::unexpected(ws.error());
    auto workspaces = parse_workspaces(*ws);
    if (!workspaces) return std::unexpected(workspaces.error());
    snap.workspaces = std::move(*workspaces);

    auto out = round_trip(ipc_msg::GET_OUTPUTS);
    if (!out) return std::unexpected(out.error());
    auto outputs = parse_outputs(*out);
    if (!outputs) return std::unexpected(outputs.error());
    snap.outputs = std::move(*outputs);

    return snap;
}

std::expected<void, Error> SwayWindowManager::run_command(const std::string& command) {
    auto reply = round_trip(ipc_msg::RUN_COMMAND, command);
    if (!reply) return std::unexpected(reply.error());
    return check_command_reply(*reply);
}

std::expected<WmEvent, Error> SwayWindowManager::read_event() {
    if (event_fd_ < 0) {
        return std::unexpected(Error{ErrorKind::TransientIo, "sway: event socket closed"});
    }

    auto frame = recv_message(event_fd_);
    if (!frame) return std::unexpected(frame.error());

    if ((frame->type & ipc_msg::EVENT_BIT) == 0) {
        return std::unexpected(Error{ErrorKind::Protocol,
                                     std::format("sway: unexpected reply type {} on event socket", frame->type)});
    }
    return parse_event(frame->type, frame->payload);
}

void SwayWindowManager::set_command_timeout(std::chrono::milliseconds timeout) {
    command_timeout_ = timeout;
    if (query_fd_ >= 0) apply_timeout(query_fd_);
}

std::expected<std::string, Error> SwayWindowManager::round_trip(uint32_t type, const std::string& payload) {
    if (query_fd_ < 0) {
        return std::unexpected(Error{ErrorKind::TransientIo, "sway: not connected"});
    }

    if (auto sent = send_message(query_fd_, type, payload); !sent) {
        return std::unexpected(sent.error());
    }

    auto reply = recv_message(query_fd_);
    if (!reply) return std::unexpected(reply.error());

    if (reply->type != type) {
        return std::unexpected(Error{ErrorKind::TransientIo,
                                     std::format("sway: reply type {} for request {}", reply->type, type)});
    }
    return std::move(reply->payload);
}

std::expected<int, Error> SwayWindowManager::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return std::unexpected(io_error("socket"));

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto err = io_error("connect");
        ::close(fd);
        return std::unexpected(err);
    }
    return fd;
}

void SwayWindowManager::apply_timeout(int fd) {
    auto ms = command_timeout_.count();
    timeval tv{.tv_sec = static_cast<time_t>(ms / 1000),
               .tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000)};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

std::expected<void, Error> SwayWindowManager::send_message(int fd, uint32_t type, const std::string& payload) {
    auto frame = encode_frame(type, payload);

    size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t n = ::send(fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(io_error("send"));
        }
        sent += static_cast<size_t>(n);
    }
    return {};
}

std::expected<SwayWindowManager::Frame, Error> SwayWindowManager::recv_message(int fd) {
    auto read_exact = [fd](char* buf, size_t len) -> std::expected<void, Error> {
        size_t read_total = 0;
        while (read_total < len) {
            ssize_t n = ::recv(fd, buf + read_total, len - read_total, 0);
            if (n == 0) {
                return std::unexpected(Error{ErrorKind::TransientIo, "sway: connection closed"});
            }
            if (n < 0) {
                if (errno == EINTR) continue;
                return std::unexpected(io_error("recv"));
            }
            read_total += static_cast<size_t>(n);
        }
        return {};
    };

    std::array<char, IPC_HEADER_LEN> header;
    if (auto ok = read_exact(header.data(), header.size()); !ok) {
        return std::unexpected(ok.error());
    }

    auto h = decode_header(header);
    if (!h) {
        // The stream cannot be resynchronized after a bad header.
        return std::unexpected(Error{ErrorKind::TransientIo, h.error().message});
    }

    Frame frame{.type = h->type, .payload = std::string(h->length, '\0')};
    if (h->length > 0) {
        if (auto ok = read_exact(frame.payload.data(), h->length); !ok) {
            return std::unexpected(ok.error());
        }
    }
    return frame;
}
