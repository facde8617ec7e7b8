#include "platform/linux/xdotool_cursor_query.hpp"

#include "cursor/cursor_locator.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void reap(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }
}

} // namespace

XdotoolCursorQuery::XdotoolCursorQuery(std::vector<std::string> argv)
    : argv_(std::move(argv)) {}

std::expected<PointerLocation, Error> XdotoolCursorQuery::query(std::chrono::milliseconds timeout) {
    if (argv_.empty()) {
        return std::unexpected(Error{ErrorKind::Configuration, "no cursor command configured"});
    }

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) < 0) {
        return std::unexpected(Error{ErrorKind::TransientIo,
                                     std::string("pipe2() failed: ") + std::strerror(errno)});
    }

    std::vector<char*> args;
    for (auto& a : argv_) args.push_back(a.data());
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
        return std::unexpected(Error{ErrorKind::TransientIo,
                                     std::string("fork() failed: ") + std::strerror(errno)});
    }

    if (pid == 0) {
        ::dup2(pipe_fds[1], STDOUT_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(pipe_fds[1]);
    int fd = pipe_fds[0];

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string output;
    bool timed_out = false;
    char buf[256];

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            timed_out = true;
            break;
        }

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;  // EOF
        output.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);

    int status = 0;
    if (timed_out) {
        ::kill(pid, SIGKILL);
        reap(pid, status);
        return std::unexpected(Error{ErrorKind::Timeout,
                                     std::format("{} exceeded {}ms", argv_[0], timeout.count())});
    }
    reap(pid, status);

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::unexpected(Error{ErrorKind::TransientIo,
                                     std::format("{} exited with status {}", argv_[0],
                                                 WIFEXITED(status) ? WEXITSTATUS(status) : -1)});
    }

    return parse_pointer_output(output);
}
