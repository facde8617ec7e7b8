#pragma once

#include "cursor/cursor_locator.hpp"
#include "errors.hpp"
#include "platform/window_manager.hpp"
#include "project_context.hpp"
#include "reconcile/visibility_reconciler.hpp"
#include "state/mark_codec.hpp"
#include "storage/event_journal.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <string>

struct RecoveryReport {
    size_t windows = 0;
    size_t owned = 0;        // windows carrying a mark of ours
    size_t decodable = 0;
    size_t undecodable = 0;  // legacy identity-only or malformed; treated as no saved state
    ReconcileReport reconcile;
};

// Rebuilds everything from the window manager on startup and after every
// reconnect. There is nothing to replay: recovery is a fresh read of the
// tree and its marks followed by an ordinary sweep.
class RecoveryManager {
public:
    using EpochClock = std::function<int64_t()>;

    RecoveryManager(WindowManager& wm, VisibilityReconciler& reconciler, CursorLocator& cursor,
                    const MarkCodec& codec, EventJournal& journal, bool verbose = false,
                    EpochClock now = {});

    std::expected<RecoveryReport, Error> recover(const ProjectContext& active, const std::string& reason);

    // Appends a disconnect/reconnect entry to the journal.
    void record(RecoveryEventKind kind, const std::string& detail);

    uint64_t recoveries() const { return recoveries_; }

private:
    void log(const std::string& msg);

    WindowManager& wm_;
    VisibilityReconciler& reconciler_;
    CursorLocator& cursor_;
    const MarkCodec& codec_;
    EventJournal& journal_;
    bool verbose_;
    EpochClock now_;
    uint64_t recoveries_ = 0;
};
