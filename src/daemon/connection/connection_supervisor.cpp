#include "connection/connection_supervisor.hpp"

#include <algorithm>
#include <cmath>

ConnectionSupervisor::ConnectionSupervisor(BackoffConfig config)
    : config_(config) {}

void ConnectionSupervisor::on_connected() {
    if (state_ == ConnectionState::Reconnecting) reconnects_++;
    state_ = ConnectionState::Connected;
    attempts_ = 0;
}

std::chrono::milliseconds ConnectionSupervisor::on_connection_lost() {
    state_ = ConnectionState::Reconnecting;
    attempts_ = 0;
    return delay_for(0);
}

std::chrono::milliseconds ConnectionSupervisor::on_attempt_failed() {
    state_ = ConnectionState::Reconnecting;
    return delay_for(++attempts_);
}

std::expected<void, Error> ConnectionSupervisor::require_connected() const {
    if (state_ == ConnectionState::Connected) return {};
    return std::unexpected(Error{ErrorKind::TransientIo,
                                 state_ == ConnectionState::Reconnecting
                                     ? "window manager connection is reconnecting"
                                     : "window manager not connected"});
}

std::chrono::milliseconds ConnectionSupervisor::delay_for(uint32_t attempt) const {
    double delay = static_cast<double>(config_.base.count()) * std::pow(config_.factor, attempt);
    double cap = static_cast<double>(config_.cap.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}
