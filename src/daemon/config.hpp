#pragma once

#include "classify/window_classifier.hpp"
#include "position/geometry.hpp"

#include <chrono>
#include <string>
#include <vector>

// Each section is validated on its own. A section that fails validation is
// rejected with an error log and the previous value of that section is kept.
struct Config {
    GapConfig gaps;

    // Size given to a window that is floated for the first time.
    struct Window {
        int width = 1000;   // 1..5000
        int height = 600;   // 1..3000
    } window;

    struct Cursor {
        int query_timeout_ms = 150;
        int cache_ttl_ms = 2000;
        std::vector<std::string> command = {"xdotool", "getmouselocation", "--shell"};

        std::chrono::milliseconds query_timeout() const { return std::chrono::milliseconds(query_timeout_ms); }
        std::chrono::milliseconds cache_ttl() const { return std::chrono::milliseconds(cache_ttl_ms); }
    } cursor;

    struct Reconnect {
        int base_ms = 250;
        double factor = 2.0;
        int cap_ms = 10000;
        int command_timeout_ms = 2000;

        std::chrono::milliseconds command_timeout() const { return std::chrono::milliseconds(command_timeout_ms); }
    } reconnect;

    struct Marks {
        std::string prefix = "scratch";
    } marks;

    struct Positioning {
        // false: shown floating windows go back to their saved position.
        bool follow_cursor = true;
    } positioning;

    struct Reconcile {
        // Slept on the event-loop thread between windows, so a sweep over N
        // windows holds off socket clients and events for N * stagger_ms.
        int stagger_ms = 0;
    } reconcile;

    std::vector<ClassificationRule> rules;

    static Config load(const std::string& path, const Config& previous = Config{});
    static Config load_default(const Config& previous = Config{});
    static std::string default_path();
};

// Applies I3RUN_{TOP,BOTTOM,LEFT,RIGHT}_GAP on top of `gaps`. Returns the
// input unchanged, with an error log, when any override is not a valid gap.
GapConfig apply_gap_env_overrides(const GapConfig& gaps);
