#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

int daemonize() {
    int ready[2];
    if (pipe2(ready, O_CLOEXEC) < 0) {
        std::println(stderr, "pipe2() failed: {}", std::strerror(errno));
        _exit(1);
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) {
        close(ready[1]);
        _exit(wait_for_ready(ready[0]));
    }
    close(ready[0]);

    if (setsid() < 0) {
        std::println(stderr, "setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    // Second fork so the daemon can never reacquire a controlling terminal.
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    umask(022);
    if (chdir("/") < 0) _exit(1);

    freopen("/dev/null", "r", stdin);
    freopen("/dev/null", "w", stdout);
    return ready[1];
}

int wait_for_ready(int ready_fd) {
    char status = 1;
    ssize_t n;
    do {
        n = read(ready_fd, &status, 1);
    } while (n < 0 && errno == EINTR);
    close(ready_fd);
    if (n != 1) return 1;
    return status == 0 ? 0 : 1;
}

void notify_ready(int ready_fd, bool ok) {
    char status = ok ? 0 : 1;
    ssize_t n;
    do {
        n = write(ready_fd, &status, 1);
    } while (n < 0 && errno == EINTR);
    close(ready_fd);
    if (ok) freopen("/dev/null", "w", stderr);
}

} // namespace platform
