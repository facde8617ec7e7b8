#include "reconcile/visibility_reconciler.hpp"

#include <chrono>
#include <format>
#include <print>
#include <thread>

namespace {

// Marks end up inside a double-quoted command argument.
std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string describe(const PositionResult& r) {
    std::string reasons;
    for (auto c : r.reasons) {
        if (!reasons.empty()) reasons += ",";
        reasons += to_string(c);
    }
    return std::format("({}, {}) on {} [{}] quadrant={} fits={}", r.x, r.y, r.monitor, reasons,
                       to_string(r.quadrant), r.fits);
}

} // namespace

VisibilityReconciler::VisibilityReconciler(WindowManager& wm, const WindowClassifier& classifier,
                                           const MarkCodec& codec, CursorLocator& cursor,
                                           const ProcessDetector& detector, ReconcileSettings settings,
                                           bool verbose, EpochClock now, Sleeper sleep)
    : wm_(wm), classifier_(classifier), codec_(codec), cursor_(cursor), detector_(detector),
      settings_(settings), verbose_(verbose), now_(std::move(now)), sleep_(std::move(sleep)) {
    if (!now_) {
        now_ = [] {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch()).count();
        };
    }
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

ReconcileReport VisibilityReconciler::reconcile(const ProjectContext& active) {
    auto snapshot = fresh_snapshot();
    if (!snapshot) {
        ReconcileReport report;
        report.errors.push_back(snapshot.error().message);
        if (snapshot.error().retryable()) report.aborted = snapshot.error();
        return report;
    }
    return reconcile(*snapshot, active);
}

ReconcileReport VisibilityReconciler::reconcile(const TreeSnapshot& snapshot, const ProjectContext& active) {
    ReconcileReport report;
    Sweep sweep{.snapshot = snapshot, .cursor = std::nullopt, .commands = 0};

    for (const auto& window : snapshot.windows) {
        report.examined++;
        auto p = plan(window, active);
        if (p.action == PlanAction::None) continue;

        if (report.commands > 0 && settings_.stagger.count() > 0) {
            sleep_(settings_.stagger);
        }

        size_t before = sweep.commands;
        auto res = apply(window, p, sweep);
        report.commands += sweep.commands - before;

        if (!res) {
            report.failed++;
            auto msg = std::format("window {}: {} ({})", window.id, res.error().message,
                                   to_string(res.error().kind));
            log(msg);
            report.errors.push_back(std::move(msg));
            // A lost connection fails every remaining window the same way.
            if (res.error().retryable()) {
                report.aborted = res.error();
                break;
            }
            continue;
        }

        switch (p.action) {
            case PlanAction::Mark: report.marked++; break;
            case PlanAction::Hide: report.hidden++; break;
            case PlanAction::Show: report.shown++; break;
            case PlanAction::Cleanup: report.cleaned++; break;
            case PlanAction::None: break;
        }
    }

    if (report.commands > 0 || report.failed > 0) {
        log(std::format("reconcile '{}': {} windows, {} marked, {} hidden, {} shown, {} failed",
                        active.name, report.examined, report.marked, report.hidden, report.shown,
                        report.failed));
    }
    return report;
}

std::expected<WindowPlan, Error> VisibilityReconciler::reconcile_window(int64_t window_id,
                                                                        const ProjectContext& active) {
    auto snapshot = fresh_snapshot();
    if (!snapshot) return std::unexpected(snapshot.error());

    const auto* window = snapshot->find(window_id);
    if (!window) return WindowPlan{.window_id = window_id};

    auto p = plan(*window, active);
    if (p.action == PlanAction::None) return p;

    Sweep sweep{.snapshot = *snapshot, .cursor = std::nullopt, .commands = 0};
    if (auto res = apply(*window, p, sweep); !res) return std::unexpected(res.error());
    return p;
}

WindowPlan VisibilityReconciler::plan(const WindowRecord& window, const ProjectContext& active) const {
    WindowPlan p;
    p.window_id = window.id;
    p.scope = classifier_.classify(window);
    p.visible = !window.in_scratchpad();

    for (const auto& m : window.marks) {
        if (!codec_.owns(m)) continue;
        if (!p.mark) p.mark = m;
        else p.extra_marks.push_back(m);
    }

    if (p.mark) {
        p.owner = codec_.identity(*p.mark);
        p.owner_from_mark = p.owner.has_value();
        p.state = codec_.decode(*p.mark);
    }

    // Ownership is only assigned to windows on screen; unmarked windows the
    // user parked in the scratchpad are left alone.
    if (!p.owner && p.scope == Scope::Scoped && p.visible) {
        std::optional<std::string> launched_for;
        if (window.pid > 0) launched_for = detector_.project_for_pid(window.pid);
        if (launched_for && valid_project_key(*launched_for)) {
            p.owner = std::move(launched_for);
        } else if (active.active()) {
            p.owner = active.name;
        }
    }

    p.desired_visible = p.scope == Scope::Global || !p.owner || *p.owner == active.name;

    if (!p.desired_visible && p.visible) {
        p.action = PlanAction::Hide;
    } else if (p.desired_visible && !p.visible && p.owner_from_mark) {
        p.action = PlanAction::Show;
    } else if (p.owner && !p.owner_from_mark && p.visible) {
        p.action = PlanAction::Mark;
    } else if (!p.extra_marks.empty()) {
        p.action = PlanAction::Cleanup;
    }
    return p;
}

std::expected<void, Error> VisibilityReconciler::apply(const WindowRecord& window, const WindowPlan& plan,
                                                       Sweep& sweep) {
    if (plan.mark && !plan.state) {
        log(std::format("window {}: mark '{}' carries no decodable state", window.id, *plan.mark));
    }

    switch (plan.action) {
        case PlanAction::None:
            return {};

        case PlanAction::Mark: {
            auto state = capture_state(std::nullopt, window, *plan.owner, now_());
            std::vector<std::string> stale = plan.extra_marks;
            if (plan.mark) stale.push_back(*plan.mark);
            log(std::format("window {} ({}) now belongs to '{}'", window.id, window.window_class, *plan.owner));
            auto mark = codec_.encode_checked(state);
            if (!mark) return std::unexpected(mark.error());
            return write_mark(window, *mark, stale, sweep);
        }

        case PlanAction::Hide:
            return hide(window, plan, sweep);

        case PlanAction::Show: {
            auto shown = show(window, plan.state, sweep);
            if (!shown) return std::unexpected(shown.error());
            for (const auto& extra : plan.extra_marks) {
                if (auto res = command(window.id, "unmark " + quote(extra), sweep); !res) return res;
            }
            return {};
        }

        case PlanAction::Cleanup:
            for (const auto& extra : plan.extra_marks) {
                if (auto res = command(window.id, "unmark " + quote(extra), sweep); !res) return res;
            }
            return {};
    }
    return {};
}

std::expected<void, Error> VisibilityReconciler::hide(const WindowRecord& window, const WindowPlan& plan,
                                                      Sweep& sweep) {
    auto state = capture_state(plan.state, window, *plan.owner, now_());
    auto mark = codec_.encode_checked(state);
    if (!mark) return std::unexpected(mark.error());

    std::vector<std::string> stale = plan.extra_marks;
    if (plan.mark) stale.push_back(*plan.mark);

    if (auto res = write_mark(window, *mark, stale, sweep); !res) return res;
    if (auto res = command(window.id, "move scratchpad", sweep); !res) return res;

    log(std::format("window {} ({}) hidden, owner '{}'", window.id, window.window_class, *plan.owner));
    return {};
}

std::expected<PositionResult, Error> VisibilityReconciler::show(
    const WindowRecord& window, const std::optional<PersistedWindowState>& state, Sweep& sweep) {
    if (auto res = command(window.id, "scratchpad show", sweep); !res) {
        return std::unexpected(res.error());
    }

    if (state && !state->floating) {
        // Back into the tiling layout of the workspace it was hidden from.
        auto move = std::format("move container to workspace number {}", state->workspace);
        if (auto res = command(window.id, move, sweep); !res) return std::unexpected(res.error());
        if (auto res = command(window.id, "floating disable", sweep); !res) return std::unexpected(res.error());

        log(std::format("window {} ({}) shown tiled on workspace {}", window.id, window.window_class,
                        state->workspace));
        PositionResult result;
        result.x = state->x;
        result.y = state->y;
        result.workspace_num = state->workspace;
        result.monitor = state->monitor;
        return result;
    }

    auto size = PositioningEngine::window_size(state, {window.rect.width, window.rect.height},
                                               settings_.default_size);
    bool at_cursor = settings_.follow_cursor || !state;
    auto placed = place_floating(window, state, size, at_cursor, sweep);
    if (placed) {
        log(std::format("window {} ({}) shown at {}", window.id, window.window_class, describe(*placed)));
    }
    return placed;
}

std::expected<PositionResult, Error> VisibilityReconciler::place_floating(
    const WindowRecord& window, const std::optional<PersistedWindowState>& state, WindowSize size,
    bool at_cursor, Sweep& sweep) {
    size_t fallback = 0;
    auto geometries = workspace_geometries(sweep.snapshot, fallback);
    if (geometries.empty()) {
        return std::unexpected(Error{ErrorKind::Protocol, "no visible workspace to place the window on"});
    }

    PositionResult result;
    if (at_cursor || !state) {
        result = engine_.position(cursor(sweep), size, geometries, fallback);
    } else {
        auto saved = *state;
        saved.width = size.width;
        saved.height = size.height;
        result = engine_.restore(saved, geometries, fallback);
    }

    if (auto res = command(window.id, std::format("resize set {} {}", size.width, size.height), sweep); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = command(window.id, std::format("move absolute position {} {}", result.x, result.y), sweep);
        !res) {
        return std::unexpected(res.error());
    }
    return result;
}

std::expected<void, Error> VisibilityReconciler::write_mark(const WindowRecord& window, const std::string& mark,
                                                            const std::vector<std::string>& stale, Sweep& sweep) {
    // New mark first, so a failure in between never leaves the window without one.
    if (auto res = command(window.id, "mark --add " + quote(mark), sweep); !res) return res;
    for (const auto& old : stale) {
        if (old == mark) continue;
        if (auto res = command(window.id, "unmark " + quote(old), sweep); !res) return res;
    }
    return {};
}

std::expected<void, Error> VisibilityReconciler::command(int64_t window_id, const std::string& cmd,
                                                         Sweep& sweep) {
    sweep.commands++;
    return wm_.run_command(std::format("[con_id={}] {}", window_id, cmd));
}

const CursorSample& VisibilityReconciler::cursor(Sweep& sweep) {
    if (!sweep.cursor) sweep.cursor = cursor_.locate();
    return *sweep.cursor;
}

std::expected<TreeSnapshot, Error> VisibilityReconciler::fresh_snapshot() {
    return wm_.snapshot();
}

std::vector<WorkspaceGeometry> VisibilityReconciler::workspace_geometries(const TreeSnapshot& snapshot,
                                                                          size_t& fallback) const {
    std::vector<WorkspaceGeometry> out;
    fallback = 0;

    const auto* focused = snapshot.focused_workspace();
    for (const auto& ws : snapshot.workspaces) {
        if (!ws.visible || ws.rect.width <= 0 || ws.rect.height <= 0) continue;
        if (focused && ws.num == focused->num && ws.output == focused->output) fallback = out.size();
        out.push_back(WorkspaceGeometry{
            .width = ws.rect.width,
            .height = ws.rect.height,
            .x_offset = ws.rect.x,
            .y_offset = ws.rect.y,
            .workspace_num = ws.num,
            .monitor = ws.output,
            .gaps = settings_.gaps,
        });
    }
    return out;
}

std::expected<PositionResult, Error> VisibilityReconciler::position_window(int64_t window_id,
                                                                           std::optional<WindowSize> size) {
    auto snapshot = fresh_snapshot();
    if (!snapshot) return std::unexpected(snapshot.error());

    const auto* window = snapshot->find(window_id);
    if (!window) {
        return std::unexpected(Error{ErrorKind::Protocol, std::format("no window with id {}", window_id)});
    }
    if (window->in_scratchpad()) {
        return std::unexpected(Error{ErrorKind::Protocol,
                                     std::format("window {} is in the scratchpad", window_id)});
    }

    Sweep sweep{.snapshot = *snapshot, .cursor = std::nullopt, .commands = 0};

    if (!window->floating) {
        if (auto res = command(window_id, "floating enable", sweep); !res) return std::unexpected(res.error());
    }

    std::optional<PersistedWindowState> state;
    if (auto mark = codec_.find_mark(*window)) state = codec_.decode(*mark);

    WindowSize current{window->rect.width, window->rect.height};
    if (!window->floating) current = {};  // tiled extents say nothing about a floating size
    auto target = size ? *size : PositioningEngine::window_size(state, current, settings_.default_size);

    auto placed = place_floating(*window, state, target, true, sweep);
    if (placed) log(std::format("window {} positioned at {}", window_id, describe(*placed)));
    return placed;
}

std::expected<PersistedWindowState, Error> VisibilityReconciler::save_state(int64_t window_id,
                                                                            const ProjectContext& active) {
    auto snapshot = fresh_snapshot();
    if (!snapshot) return std::unexpected(snapshot.error());

    const auto* window = snapshot->find(window_id);
    if (!window) {
        return std::unexpected(Error{ErrorKind::Protocol, std::format("no window with id {}", window_id)});
    }

    auto p = plan(*window, active);
    std::optional<std::string> owner = p.owner;
    if (!owner && active.active()) owner = active.name;
    if (!owner) {
        return std::unexpected(Error{ErrorKind::Configuration,
                                     std::format("window {} has no owning project and none is active", window_id)});
    }

    auto state = capture_state(p.state, *window, *owner, now_());
    std::vector<std::string> stale = p.extra_marks;
    if (p.mark) stale.push_back(*p.mark);

    auto mark = codec_.encode_checked(state);
    if (!mark) return std::unexpected(mark.error());

    Sweep sweep{.snapshot = *snapshot, .cursor = std::nullopt, .commands = 0};
    if (auto res = write_mark(*window, *mark, stale, sweep); !res) {
        return std::unexpected(res.error());
    }
    return state;
}

std::expected<PositionResult, Error> VisibilityReconciler::restore_state(int64_t window_id) {
    auto snapshot = fresh_snapshot();
    if (!snapshot) return std::unexpected(snapshot.error());

    const auto* window = snapshot->find(window_id);
    if (!window) {
        return std::unexpected(Error{ErrorKind::Protocol, std::format("no window with id {}", window_id)});
    }

    auto mark = codec_.find_mark(*window);
    auto state = mark ? codec_.decode(*mark) : std::nullopt;
    if (!state) {
        return std::unexpected(Error{ErrorKind::StateDecode,
                                     std::format("window {} has no saved state", window_id)});
    }

    Sweep sweep{.snapshot = *snapshot, .cursor = std::nullopt, .commands = 0};
    if (window->in_scratchpad()) return show(*window, state, sweep);

    if (!state->floating) {
        if (window->floating) {
            if (auto res = command(window_id, "floating disable", sweep); !res) return std::unexpected(res.error());
        }
        if (window->workspace_num != state->workspace) {
            auto move = std::format("move container to workspace number {}", state->workspace);
            if (auto res = command(window_id, move, sweep); !res) return std::unexpected(res.error());
        }
        PositionResult result;
        result.x = state->x;
        result.y = state->y;
        result.workspace_num = state->workspace;
        result.monitor = state->monitor;
        return result;
    }

    if (!window->floating) {
        if (auto res = command(window_id, "floating enable", sweep); !res) return std::unexpected(res.error());
    }
    return place_floating(*window, state, {state->width, state->height}, false, sweep);
}

void VisibilityReconciler::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[i3pm] {}", msg);
    }
}

const char* to_string(PlanAction action) {
    switch (action) {
        case PlanAction::None: return "none";
        case PlanAction::Mark: return "mark";
        case PlanAction::Hide: return "hide";
        case PlanAction::Show: return "show";
        case PlanAction::Cleanup: return "cleanup";
    }
    return "none";
}
