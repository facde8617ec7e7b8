#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <expected>

struct PointerLocation {
    int x = 0;
    int y = 0;
    int screen = 0;
    int64_t window = 0;  // window under the pointer, 0 if unknown
};

// External pointer-location source. Must give up once `timeout` has elapsed
// and report ErrorKind::Timeout.
class CursorQuery {
public:
    virtual ~CursorQuery() = default;
    virtual std::expected<PointerLocation, Error> query(std::chrono::milliseconds timeout) = 0;
};
