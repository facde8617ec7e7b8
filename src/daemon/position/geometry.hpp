#pragma once

#include <algorithm>
#include <string>

struct GapConfig {
    static constexpr int MAX_GAP = 500;

    int top = 10;
    int bottom = 10;
    int left = 10;
    int right = 10;

    bool valid() const {
        auto ok = [](int g) { return g >= 0 && g <= MAX_GAP; };
        return ok(top) && ok(bottom) && ok(left) && ok(right);
    }

    bool operator==(const GapConfig&) const = default;
};

// One monitor's visible workspace. Offsets place it in the global coordinate space.
struct WorkspaceGeometry {
    int width = 0;
    int height = 0;
    int x_offset = 0;
    int y_offset = 0;
    int workspace_num = 1;
    std::string monitor;
    GapConfig gaps;

    int available_width() const { return std::max(0, width - gaps.left - gaps.right); }
    int available_height() const { return std::max(0, height - gaps.top - gaps.bottom); }

    bool contains(int x, int y) const {
        return x >= x_offset && x < x_offset + width && y >= y_offset && y < y_offset + height;
    }
};

struct WindowSize {
    int width = 0;
    int height = 0;
};
