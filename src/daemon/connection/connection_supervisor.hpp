#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <expected>

struct BackoffConfig {
    std::chrono::milliseconds base{250};
    double factor = 2.0;
    std::chrono::milliseconds cap{10000};

    bool valid() const { return base.count() > 0 && factor >= 1.0 && cap >= base; }
};

enum class ConnectionState { Disconnected, Connected, Reconnecting };

// Connection state machine for the window-manager link. Owns no sockets:
// the event loop reports what happened and arms its timer with the returned delay.
class ConnectionSupervisor {
public:
    explicit ConnectionSupervisor(BackoffConfig config = {});

    void on_connected();

    // Enters Reconnecting and returns the delay before the first attempt.
    std::chrono::milliseconds on_connection_lost();

    // Delay before the next attempt.
    std::chrono::milliseconds on_attempt_failed();

    // Commands that need the window manager fail fast, and retryably, unless connected.
    std::expected<void, Error> require_connected() const;

    // base * factor^attempt, capped.
    std::chrono::milliseconds delay_for(uint32_t attempt) const;

    void set_config(BackoffConfig config) { config_ = config; }
    const BackoffConfig& config() const { return config_; }

    ConnectionState state() const { return state_; }
    uint32_t attempts() const { return attempts_; }
    uint64_t reconnects() const { return reconnects_; }

private:
    BackoffConfig config_;
    ConnectionState state_ = ConnectionState::Disconnected;
    uint32_t attempts_ = 0;    // in the current reconnect cycle
    uint64_t reconnects_ = 0;  // successful reconnects since start
};

const char* to_string(ConnectionState state);
