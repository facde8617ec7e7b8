#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <string>

enum class WmEventKind { Window, Workspace, Output, Shutdown };

struct WmEvent {
    WmEventKind kind = WmEventKind::Window;
    std::string change;        // "new", "close", "focus", "mark", "move", "restart", ...
    int64_t container_id = 0;  // window events only
};

// Parses one event frame. Unknown event types and malformed payloads are
// reported as ErrorKind::Protocol so the caller can drop them.
std::expected<WmEvent, Error> parse_event(uint32_t type, const std::string& payload);

const char* to_string(WmEventKind kind);
