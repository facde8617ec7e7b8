#pragma once

#include <chrono>

enum class CursorSource { Live, Cached, FallbackCenter };

struct CursorSample {
    int x = 0;
    int y = 0;
    CursorSource source = CursorSource::FallbackCenter;
    bool valid = false;
    std::chrono::steady_clock::time_point timestamp{};
};

const char* to_string(CursorSource source);
