#pragma once

#include "cursor/cursor_sample.hpp"
#include "position/geometry.hpp"
#include "state/mark_codec.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

enum class Constraint {
    Centered,
    ConstrainedTop,
    ConstrainedBottom,
    ConstrainedLeft,
    ConstrainedRight,
    OversizedFallback,
    CursorInvalid,
};

enum class Quadrant { None, TopLeft, TopRight, BottomLeft, BottomRight };

struct PositionResult {
    int x = 0;  // absolute
    int y = 0;  // absolute
    std::vector<Constraint> reasons;
    Quadrant quadrant = Quadrant::None;
    bool fits = true;
    std::string monitor;
    int workspace_num = 1;

    bool has(Constraint c) const;
};

// Boundary detection for summoning a floating window to the pointer.
// Pure geometry: no I/O, no clock.
class PositioningEngine {
public:
    // `workspaces` holds the visible workspace of each monitor; `fallback` indexes
    // the active one and is used when the cursor lies on none of them.
    PositionResult position(const CursorSample& cursor, WindowSize size,
                            std::span<const WorkspaceGeometry> workspaces, size_t fallback) const;

    // Single-monitor form.
    PositionResult position(const CursorSample& cursor, WindowSize size,
                            const WorkspaceGeometry& workspace) const;

    // Puts a window back at a saved absolute position, kept inside the gaps of
    // whichever workspace contains that position.
    PositionResult restore(const PersistedWindowState& state,
                           std::span<const WorkspaceGeometry> workspaces, size_t fallback) const;

    // Size to place: prior state first, then the live window, then the default.
    static WindowSize window_size(const std::optional<PersistedWindowState>& prior,
                                  WindowSize current, WindowSize fallback);
};

const char* to_string(Constraint c);
const char* to_string(Quadrant q);
