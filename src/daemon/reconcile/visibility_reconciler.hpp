#pragma once

#include "classify/window_classifier.hpp"
#include "cursor/cursor_locator.hpp"
#include "errors.hpp"
#include "platform/process_detector.hpp"
#include "platform/window_manager.hpp"
#include "position/geometry.hpp"
#include "position/positioning_engine.hpp"
#include "project_context.hpp"
#include "state/mark_codec.hpp"
#include "sway/window_record.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class PlanAction {
    None,     // already where it should be
    Mark,     // visible and staying visible, but needs its first mark
    Hide,     // save state into the mark, then move to the scratchpad
    Show,     // bring back from the scratchpad using the saved state
    Cleanup,  // drop duplicate marks of ours
};

// What one sweep step decided for one window. Recomputed from scratch on
// every sweep, never carried over.
struct WindowPlan {
    int64_t window_id = 0;
    Scope scope = Scope::Global;
    std::optional<std::string> owner;   // project from our mark, or the one about to be assigned
    bool owner_from_mark = false;
    std::optional<std::string> mark;    // first mark of ours on the window
    std::vector<std::string> extra_marks;
    std::optional<PersistedWindowState> state;  // decoded from `mark`
    bool visible = true;
    bool desired_visible = true;
    PlanAction action = PlanAction::None;
};

struct ReconcileReport {
    size_t examined = 0;
    size_t marked = 0;
    size_t hidden = 0;
    size_t shown = 0;
    size_t cleaned = 0;
    size_t failed = 0;
    size_t commands = 0;
    std::vector<std::string> errors;
    // Set when a retryable failure (lost connection, timeout) ended the sweep early.
    std::optional<Error> aborted;
};

struct ReconcileSettings {
    WindowSize default_size{DEFAULT_STATE_WIDTH, DEFAULT_STATE_HEIGHT};
    GapConfig gaps;
    bool follow_cursor = true;
    std::chrono::milliseconds stagger{0};
};

// Maps every window to a project and shows or hides it accordingly. The
// window manager's tree and marks are the only inputs; nothing is cached
// between calls, so running it twice in a row issues no further commands.
class VisibilityReconciler {
public:
    using EpochClock = std::function<int64_t()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    VisibilityReconciler(WindowManager& wm, const WindowClassifier& classifier,
                         const MarkCodec& codec, CursorLocator& cursor,
                         const ProcessDetector& detector, ReconcileSettings settings,
                         bool verbose = false, EpochClock now = {}, Sleeper sleep = {});

    // Full sweep over a fresh snapshot.
    ReconcileReport reconcile(const ProjectContext& active);

    // Full sweep over a snapshot the caller just took.
    ReconcileReport reconcile(const TreeSnapshot& snapshot, const ProjectContext& active);

    // One window, from a fresh snapshot. A window that no longer exists is not an error.
    std::expected<WindowPlan, Error> reconcile_window(int64_t window_id, const ProjectContext& active);

    // Decision only, no commands.
    WindowPlan plan(const WindowRecord& window, const ProjectContext& active) const;

    // Moves a floating window so it is centered on the pointer, inside the gaps.
    std::expected<PositionResult, Error> position_window(int64_t window_id,
                                                         std::optional<WindowSize> size);

    // Writes the window's current state into its mark (decode, modify, encode, overwrite).
    std::expected<PersistedWindowState, Error> save_state(int64_t window_id,
                                                          const ProjectContext& active);

    // Applies the state saved in the window's mark.
    std::expected<PositionResult, Error> restore_state(int64_t window_id);

    void set_settings(ReconcileSettings settings) { settings_ = settings; }
    const ReconcileSettings& settings() const { return settings_; }

    // Visible workspace of every output as positioning input; `fallback`
    // receives the index of the focused one.
    std::vector<WorkspaceGeometry> workspace_geometries(const TreeSnapshot& snapshot,
                                                        size_t& fallback) const;

private:
    struct Sweep {
        const TreeSnapshot& snapshot;
        std::optional<CursorSample> cursor;  // sampled at most once per sweep
        size_t commands = 0;
    };

    std::expected<void, Error> apply(const WindowRecord& window, const WindowPlan& plan, Sweep& sweep);
    std::expected<void, Error> hide(const WindowRecord& window, const WindowPlan& plan, Sweep& sweep);
    std::expected<PositionResult, Error> show(const WindowRecord& window,
                                              const std::optional<PersistedWindowState>& state,
                                              Sweep& sweep);
    std::expected<PositionResult, Error> place_floating(const WindowRecord& window,
                                                        const std::optional<PersistedWindowState>& state,
                                                        WindowSize size, bool at_cursor, Sweep& sweep);
    std::expected<void, Error> write_mark(const WindowRecord& window, const std::string& mark,
                                          const std::vector<std::string>& stale, Sweep& sweep);
    std::expected<void, Error> command(int64_t window_id, const std::string& cmd, Sweep& sweep);

    const CursorSample& cursor(Sweep& sweep);
    std::expected<TreeSnapshot, Error> fresh_snapshot();
    void log(const std::string& msg);

    WindowManager& wm_;
    const WindowClassifier& classifier_;
    const MarkCodec& codec_;
    CursorLocator& cursor_;
    const ProcessDetector& detector_;
    ReconcileSettings settings_;
    bool verbose_;
    EpochClock now_;
    Sleeper sleep_;
    PositioningEngine engine_;
};

const char* to_string(PlanAction action);
