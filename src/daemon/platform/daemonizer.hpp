#pragma once

namespace platform {

// Double fork and new session. The invoking process does not return: it waits
// for the detached daemon's notify_ready() and exits with its status, so a
// failed startup still reaches the shell. stderr stays on the terminal until
// then. Returns the readiness fd in the daemon.
int daemonize();

// Blocks on the readiness fd and returns the exit status to use. A daemon that
// dies before reporting counts as a failure.
int wait_for_ready(int ready_fd);

// Reports startup success or failure and closes the fd. On success stderr
// moves to /dev/null.
void notify_ready(int ready_fd, bool ok);

} // namespace platform
