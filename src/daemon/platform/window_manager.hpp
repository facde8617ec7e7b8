#pragma once

#include "errors.hpp"
#include "sway/window_record.hpp"
#include "sway/wm_event.hpp"

#include <expected>
#include <string>

class WindowManager {
public:
    virtual ~WindowManager() = default;

    // Opens the query connection. A failure here on startup is a fatal handshake.
    virtual std::expected<void, Error> connect() = 0;

    // Opens the event connection and subscribes to window/workspace/output/shutdown.
    virtual std::expected<void, Error> subscribe() = 0;

    virtual void disconnect() = 0;
    virtual bool connected() const = 0;

    // Tree, workspaces and outputs in three round trips.
    virtual std::expected<TreeSnapshot, Error> snapshot() = 0;

    // One RUN_COMMAND round trip; a reply with success:false is an error.
    virtual std::expected<void, Error> run_command(const std::string& command) = 0;

    // FD for epoll registration (event subscription socket), -1 when disconnected.
    virtual int event_fd() const = 0;

    // Read one event. Call when event_fd() is readable.
    virtual std::expected<WmEvent, Error> read_event() = 0;
};
