#pragma once

#include "cursor/cursor_sample.hpp"
#include "errors.hpp"
#include "platform/cursor_query.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

// Parses `KEY=VALUE` lines as printed by `xdotool getmouselocation --shell`.
// X and Y are required, SCREEN and WINDOW are optional.
std::expected<PointerLocation, Error> parse_pointer_output(std::string_view output);

// Three tiers: live query, then a cached sample still within its TTL, then an
// invalid sample that tells the positioning engine to use the workspace center.
// locate() always returns a sample.
class CursorLocator {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Settings {
        std::chrono::milliseconds query_timeout{150};
        std::chrono::milliseconds cache_ttl{2000};
    };

    struct Stats {
        uint64_t live = 0;
        uint64_t cached = 0;
        uint64_t fallback = 0;
    };

    CursorLocator(CursorQuery& query, Settings settings, bool verbose = false,
                  Clock clock = [] { return std::chrono::steady_clock::now(); });

    CursorSample locate();

    // Forget the cached sample. Recovery calls this so nothing survives a reconnect.
    void clear_cache() { cache_.reset(); }

    void set_settings(Settings settings) { settings_ = settings; }
    const Settings& settings() const { return settings_; }
    const Stats& stats() const { return stats_; }

private:
    std::optional<PointerLocation> query_live();
    void log(const std::string& msg);

    CursorQuery& query_;
    Settings settings_;
    bool verbose_;
    Clock clock_;

    std::optional<CursorSample> cache_;
    Stats stats_;
};
