#include "positioning_engine.hpp"

#include <algorithm>

namespace {

struct Axis {
    int gap_lo;          // gap at the origin side (top or left)
    int brk;             // last coordinate that keeps the far gap (breakY / breakX)
    Constraint lo_reason;
    Constraint hi_reason;
};

void add_reason(std::vector<Constraint>& reasons, Constraint c) {
    if (std::ranges::find(reasons, c) == reasons.end()) reasons.push_back(c);
}

// Oversized: the window cannot keep both gaps on this axis, so it is
// anchored at the origin gap instead of centered. A break between 0 and the
// origin gap counts too; no position on that axis satisfies both gaps.
bool oversized(const Axis& axis) {
    return axis.brk < axis.gap_lo;
}

// Clamp against both edges. Used after the quadrant clamp, and on its own
// where no quadrant applies.
int clamp_both(int pos, const Axis& axis, std::vector<Constraint>& reasons) {
    if (pos < axis.gap_lo) {
        add_reason(reasons, axis.lo_reason);
        return axis.gap_lo;
    }
    if (pos > axis.brk) {
        add_reason(reasons, axis.hi_reason);
        return axis.brk;
    }
    return pos;
}

int place_axis(int tmp, const Axis& axis, bool far_half, std::vector<Constraint>& reasons,
               bool& fits) {
    if (oversized(axis)) {
        fits = false;
        add_reason(reasons, Constraint::OversizedFallback);
        return axis.gap_lo;
    }

    // One clamp per axis, against the edge of the half the cursor is in.
    if (far_half) {
        if (tmp > axis.brk) {
            add_reason(reasons, axis.hi_reason);
            tmp = axis.brk;
        }
    } else if (tmp < axis.gap_lo) {
        add_reason(reasons, axis.lo_reason);
        tmp = axis.gap_lo;
    }

    // Uneven gaps can still push a centered window past the opposite edge.
    return clamp_both(tmp, axis, reasons);
}

Axis x_axis(const WorkspaceGeometry& ws, int win_width) {
    return Axis{
        .gap_lo = ws.gaps.left,
        .brk = ws.width - (ws.gaps.right + win_width),
        .lo_reason = Constraint::ConstrainedLeft,
        .hi_reason = Constraint::ConstrainedRight,
    };
}

Axis y_axis(const WorkspaceGeometry& ws, int win_height) {
    return Axis{
        .gap_lo = ws.gaps.top,
        .brk = ws.height - (ws.gaps.bottom + win_height),
        .lo_reason = Constraint::ConstrainedTop,
        .hi_reason = Constraint::ConstrainedBottom,
    };
}

size_t select_workspace(std::span<const WorkspaceGeometry> workspaces, int x, int y, bool use_point,
                        size_t fallback) {
    if (use_point) {
        for (size_t i = 0; i < workspaces.size(); ++i) {
            if (workspaces[i].contains(x, y)) return i;
        }
    }
    return fallback < workspaces.size() ? fallback : 0;
}

} // namespace

bool PositionResult::has(Constraint c) const {
    return std::ranges::find(reasons, c) != reasons.end();
}

PositionResult PositioningEngine::position(const CursorSample& cursor, WindowSize size,
                                           std::span<const WorkspaceGeometry> workspaces,
                                           size_t fallback) const {
    PositionResult result;
    if (workspaces.empty()) {
        result.fits = false;
        result.reasons.push_back(Constraint::CursorInvalid);
        return result;
    }

    const auto& ws = workspaces[select_workspace(workspaces, cursor.x, cursor.y, cursor.valid, fallback)];
    result.monitor = ws.monitor;
    result.workspace_num = ws.workspace_num;

    auto ax = x_axis(ws, size.width);
    auto ay = y_axis(ws, size.height);

    int local_x = 0;
    int local_y = 0;

    if (!cursor.valid) {
        // No usable pointer: the workspace center, kept inside the gaps.
        result.reasons.push_back(Constraint::CursorInvalid);
        if (oversized(ax)) {
            result.fits = false;
            add_reason(result.reasons, Constraint::OversizedFallback);
            local_x = ax.gap_lo;
        } else {
            local_x = clamp_both(ws.width / 2 - size.width / 2, ax, result.reasons);
        }
        if (oversized(ay)) {
            result.fits = false;
            add_reason(result.reasons, Constraint::OversizedFallback);
            local_y = ay.gap_lo;
        } else {
            local_y = clamp_both(ws.height / 2 - size.height / 2, ay, result.reasons);
        }
    } else {
        int cx = cursor.x - ws.x_offset;
        int cy = cursor.y - ws.y_offset;

        // Integer division biases odd sizes half a pixel toward the origin.
        int tmp_x = cx - size.width / 2;
        int tmp_y = cy - size.height / 2;

        // The midpoint itself belongs to the lower/right half on both axes.
        bool right = cx >= ws.width / 2;
        bool lower = cy >= ws.height / 2;
        result.quadrant = lower ? (right ? Quadrant::BottomRight : Quadrant::BottomLeft)
                                : (right ? Quadrant::TopRight : Quadrant::TopLeft);

        local_y = place_axis(tmp_y, ay, lower, result.reasons, result.fits);
        local_x = place_axis(tmp_x, ax, right, result.reasons, result.fits);

        if (result.reasons.empty()) result.reasons.push_back(Constraint::Centered);
    }

    result.x = local_x + ws.x_offset;
    result.y = local_y + ws.y_offset;
    return result;
}

PositionResult PositioningEngine::position(const CursorSample& cursor, WindowSize size,
                                           const WorkspaceGeometry& workspace) const {
    return position(cursor, size, std::span<const WorkspaceGeometry>(&workspace, 1), 0);
}

PositionResult PositioningEngine::restore(const PersistedWindowState& state,
                                          std::span<const WorkspaceGeometry> workspaces,
                                          size_t fallback) const {
    PositionResult result;
    if (workspaces.empty()) {
        result.x = state.x;
        result.y = state.y;
        result.fits = false;
        return result;
    }

    const auto& ws = workspaces[select_workspace(workspaces, state.x, state.y, true, fallback)];
    result.monitor = ws.monitor;
    result.workspace_num = ws.workspace_num;

    auto ax = x_axis(ws, state.width);
    auto ay = y_axis(ws, state.height);

    int local_x = state.x - ws.x_offset;
    int local_y = state.y - ws.y_offset;

    if (oversized(ax)) {
        result.fits = false;
        add_reason(result.reasons, Constraint::OversizedFallback);
        local_x = ax.gap_lo;
    } else {
        local_x = clamp_both(local_x, ax, result.reasons);
    }
    if (oversized(ay)) {
        result.fits = false;
        add_reason(result.reasons, Constraint::OversizedFallback);
        local_y = ay.gap_lo;
    } else {
        local_y = clamp_both(local_y, ay, result.reasons);
    }

    result.x = local_x + ws.x_offset;
    result.y = local_y + ws.y_offset;
    return result;
}

WindowSize PositioningEngine::window_size(const std::optional<PersistedWindowState>& prior,
                                          WindowSize current, WindowSize fallback) {
    if (prior && prior->width > 0 && prior->height > 0) return {prior->width, prior->height};
    if (current.width > 0 && current.height > 0) return current;
    return fallback;
}

const char* to_string(Constraint c) {
    switch (c) {
        case Constraint::Centered: return "centered";
        case Constraint::ConstrainedTop: return "constrained-top";
        case Constraint::ConstrainedBottom: return "constrained-bottom";
        case Constraint::ConstrainedLeft: return "constrained-left";
        case Constraint::ConstrainedRight: return "constrained-right";
        case Constraint::OversizedFallback: return "oversized-fallback";
        case Constraint::CursorInvalid: return "cursor-invalid";
    }
    return "unknown";
}

const char* to_string(Quadrant q) {
    switch (q) {
        case Quadrant::None: return "none";
        case Quadrant::TopLeft: return "top-left";
        case Quadrant::TopRight: return "top-right";
        case Quadrant::BottomLeft: return "bottom-left";
        case Quadrant::BottomRight: return "bottom-right";
    }
    return "none";
}
