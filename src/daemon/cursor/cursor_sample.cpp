#include "cursor/cursor_sample.hpp"

const char* to_string(CursorSource source) {
    switch (source) {
        case CursorSource::Live: return "live";
        case CursorSource::Cached: return "cached";
        case CursorSource::FallbackCenter: return "fallback-center";
    }
    return "unknown";
}
