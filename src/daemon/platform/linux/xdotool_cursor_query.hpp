#pragma once

#include "platform/cursor_query.hpp"

#include <string>
#include <vector>

// Runs `xdotool getmouselocation --shell` (or a configured equivalent) and
// parses its stdout. The child is killed when the timeout expires.
class XdotoolCursorQuery : public CursorQuery {
public:
    explicit XdotoolCursorQuery(std::vector<std::string> argv);

    std::expected<PointerLocation, Error> query(std::chrono::milliseconds timeout) override;

    void set_command(std::vector<std::string> argv) { argv_ = std::move(argv); }

private:
    std::vector<std::string> argv_;
};
