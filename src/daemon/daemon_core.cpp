#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<int64_t> window_id_of(const json& cmd) {
    auto id = cmd.value("window_id", int64_t{0});
    if (id <= 0) return std::nullopt;
    return id;
}

json missing_window_id() {
    return {{"status", "error"}, {"message", "window_id required"}, {"retryable", false}};
}

} // namespace

DaemonCore::Paths DaemonCore::Paths::defaults() {
    Paths p;
    auto config = platform::config_dir();
    p.active_project = (fs::path(config.empty() ? "/tmp/i3pm" : config) / "active-project.json").string();
    auto data = platform::data_dir();
    p.journal = (fs::path(data.empty() ? "/tmp/i3pm" : data) / "events.db").string();
    return p;
}

DaemonCore::DaemonCore(Config config, bool verbose, Paths paths,
                       WindowManager& wm, CursorQuery& cursor_query, ProcessDetector& detector,
                       ScheduleReconnect schedule)
    : config_(std::move(config)), verbose_(verbose), paths_(std::move(paths)),
      wm_(wm), detector_(detector), schedule_(std::move(schedule)),
      codec_(config_.marks.prefix),
      classifier_(config_.rules),
      cursor_(cursor_query,
              CursorLocator::Settings{config_.cursor.query_timeout(), config_.cursor.cache_ttl()},
              verbose_),
      reconciler_(wm_, classifier_, codec_, cursor_, detector_, reconcile_settings(), verbose_),
      recovery_(wm_, reconciler_, cursor_, codec_, journal_, verbose_),
      supervisor_(BackoffConfig{std::chrono::milliseconds(config_.reconnect.base_ms),
                                config_.reconnect.factor,
                                std::chrono::milliseconds(config_.reconnect.cap_ms)}) {}

DaemonCore::~DaemonCore() = default;

void DaemonCore::init() {
    if (!journal_.open(paths_.journal)) {
        std::println(stderr, "journal: {} unavailable, recovery events will not be recorded", paths_.journal);
    }

    auto ctx = load_active_project(paths_.active_project);
    if (ctx) {
        active_ = *ctx;
    } else {
        std::println(stderr, "state: {}, starting with no active project", ctx.error().message);
    }
    log(active_.active() ? "active project: " + active_.name : "no active project");
}

std::expected<void, Error> DaemonCore::start() {
    if (auto res = handshake(); !res) {
        return std::unexpected(Error{ErrorKind::FatalHandshake, res.error().message});
    }
    supervisor_.on_connected();
    log("window manager connected");

    // Subscribed before the snapshot, so no event is lost; queued events are
    // only read after recovery has run against the fresh tree.
    run_recovery("startup");
    return {};
}

std::expected<void, Error> DaemonCore::handshake() {
    if (auto res = wm_.connect(); !res) return res;
    if (auto res = wm_.subscribe(); !res) {
        wm_.disconnect();
        return res;
    }
    return {};
}

void DaemonCore::run_recovery(const std::string& reason) {
    auto report = recovery_.recover(active_, reason);
    if (!report && report.error().retryable()) {
        connection_lost("recovery: " + report.error().message);
    }
}

void DaemonCore::connection_lost(const std::string& reason) {
    if (supervisor_.state() == ConnectionState::Reconnecting) return;

    wm_.disconnect();
    auto delay = supervisor_.on_connection_lost();
    recovery_.record(RecoveryEventKind::Disconnect, reason);
    log(std::format("window manager connection lost ({}), retrying in {}ms", reason, delay.count()));
    schedule_(delay);
}

void DaemonCore::on_reconnect_timer() {
    if (supervisor_.state() != ConnectionState::Reconnecting) return;

    if (auto res = handshake(); !res) {
        auto delay = supervisor_.on_attempt_failed();
        log(std::format("reconnect attempt {} failed: {}, next in {}ms", supervisor_.attempts(),
                        res.error().message, delay.count()));
        schedule_(delay);
        return;
    }

    auto failed_attempts = supervisor_.attempts();
    supervisor_.on_connected();
    recovery_.record(RecoveryEventKind::Reconnect, std::format("after {} failed attempts", failed_attempts));
    log("window manager reconnected");
    run_recovery("reconnect");
}

void DaemonCore::on_wm_readable() {
    auto event = wm_.read_event();
    if (!event) {
        if (event.error().retryable()) {
            connection_lost(event.error().message);
        } else {
            // One bad frame; the stream itself is still aligned.
            log("dropping malformed event: " + event.error().message);
        }
        return;
    }
    handle_event(*event);
}

void DaemonCore::handle_event(const WmEvent& event) {
    switch (event.kind) {
        case WmEventKind::Window: on_window_event(event); break;
        case WmEventKind::Workspace: on_workspace_event(event); break;
        case WmEventKind::Output: on_output_event(event); break;
        case WmEventKind::Shutdown: on_shutdown_event(event); break;
    }
}

void DaemonCore::on_window_event(const WmEvent& event) {
    // Only changes that can alter classification or ownership. Moves and
    // scratchpad toggles made by the user are not undone.
    if (event.change != "new" && event.change != "title") return;

    auto res = reconciler_.reconcile_window(event.container_id, active_);
    if (!res) {
        log(std::format("window {} ({}): {}", event.container_id, event.change, res.error().message));
        if (res.error().retryable()) connection_lost(res.error().message);
        return;
    }
    if (res->action != PlanAction::None) {
        log(std::format("window {} ({}): {}", event.container_id, event.change, to_string(res->action)));
    }
}

void DaemonCore::on_workspace_event(const WmEvent& event) {
    log("workspace " + event.change);
}

void DaemonCore::on_output_event(const WmEvent& event) {
    // Monitor layout changed; a cached pointer position may now be off-screen.
    cursor_.clear_cache();
    log("output " + event.change);
}

void DaemonCore::on_shutdown_event(const WmEvent& event) {
    connection_lost("window manager " + (event.change.empty() ? std::string("shutdown") : event.change));
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str, const nlohmann::json& cmd) {
    try {
        if (cmd_str == "switch") return handle_switch(cmd);
        if (cmd_str == "reconcile") return handle_reconcile(cmd);
        if (cmd_str == "classify") return handle_classify(cmd);
        if (cmd_str == "position") return handle_position(cmd);
        if (cmd_str == "save-state") return handle_save_state(cmd);
        if (cmd_str == "restore-state") return handle_restore_state(cmd);
        if (cmd_str == "recover") return handle_recover(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "dump") return handle_dump(cmd);
        if (cmd_str == "events") return handle_events(cmd);
    } catch (const json::exception& e) {
        return fail(Error{ErrorKind::Protocol, std::string("bad request: ") + e.what()});
    }
    return {{"status", "error"}, {"message", "unknown command"}, {"retryable", false}};
}

json DaemonCore::handle_switch(const json& cmd) {
    if (auto ok = supervisor_.require_connected(); !ok) return fail(ok.error());

    ProjectContext next{cmd.value("project", std::string{})};
    if (next.active() && !valid_project_key(next.name)) {
        return fail(Error{ErrorKind::Configuration, std::format("invalid project name '{}'", next.name)});
    }

    auto previous = active_.name;
    active_ = std::move(next);
    if (auto saved = save_active_project(paths_.active_project, active_); !saved) {
        std::println(stderr, "state: {}", saved.error().message);
    }
    log(std::format("switch '{}' -> '{}'", previous, active_.name));

    auto report = reconciler_.reconcile(active_);
    if (report.aborted) return fail(*report.aborted);

    json resp = {{"status", "ok"}, {"project", active_.name}, {"previous", previous}};
    resp["reconcile"] = to_json(report);
    return resp;
}

json DaemonCore::handle_reconcile(const json& /*cmd*/) {
    if (auto ok = supervisor_.require_connected(); !ok) return fail(ok.error());

    auto report = reconciler_.reconcile(active_);
    if (report.aborted) return fail(*report.aborted);
    return {{"status", "ok"}, {"project", active_.name}, {"reconcile", to_json(report)}};
}

json DaemonCore::handle_classify(const json& cmd) {
    if (auto ok = supervisor_.require_connected(); !ok) return fail(ok.error());
    auto id = window_id_of(cmd);
    if (!id) return missing_window_id();

    auto snapshot = wm_.snapshot();
    if (!snapshot) return fail(snapshot.error());
    const auto* window = snapshot->find(*id);
    if (!window) return fail(Error{ErrorKind::Protocol, std::format("no window with id {}", *id)});

    auto plan = reconciler_.plan(*window, active_);
    json resp = {{"status", "ok"},
                 {"window_id", *id},
                 {"scope", to_string(plan.scope)},
                 {"owner", plan.owner ? json(*plan.owner) : json(nullptr)},
                 {"desired_visible", plan.desired_visible}};
    if (const auto* rule = classifier_.match(*window)) {
        resp["rule"] = {{"pattern", rule->pattern},
                        {"type", to_string(rule->type)},
                        {"priority", rule->priority},
                        {"source", to_string(rule->source)}};
    } else {
        resp["rule"] = nullptr;
    }
    return resp;
}

json DaemonCore::handle_position(const json& cmd) {
    if (auto ok = supervisor_.require_connected(); !ok) return fail(ok.error());
    auto id = window_id_of(cmd);
    if (!id) return missing_window_id();

    std::optional<WindowSize> size;
    if (cmd.contains("width") && cmd.contains("height")) {
        WindowSize s{cmd["width"].get<int>(), cmd["height"].get<int>()};
        if (s.width <= 0 || s.height <= 0) {
            return fail(Error{ErrorKind::Configuration, "width and height must be positive"});
        }
        size = s;
    }

    auto result = reconciler_.position_window(*id, size);
    if (!result) return fail(result.error());
    return {{"status", "ok"}, {"position", to_json(*result)}};
}

json DaemonCore::handle_save_state(const json& cmd) {
    if (auto ok = supervisor_.require_connected(); !ok) return fail(ok.error());
    auto id = window_id_of(cmd);
    if (!id) return missing_window_id();

    auto state = reconciler_.save_state(*id, active_);
    if (!state) return fail(state.error());
    return {{"status", "ok"}, {"state", to_json(*state)}, {"mark", codec_.encode(*state)}};
}

json DaemonCore::handle_restore_state(const json& cmd) {
    if (auto ok = supervisor_.require_connected(); !ok) return fail(ok.error());
    auto id = window_id_of(cmd);
    if (!id) return missing_window_id();

    auto result = reconciler_.restore_state(*id);
    if (!result) return fail(result.error());
    return {{"status", "ok"}, {"position", to_json(*result)}};
}

json DaemonCore::handle_recover(const json& /*cmd*/) {
    if (auto ok = supervisor_.require_connected(); !ok) return fail(ok.error());

    auto report = recovery_.recover(active_, "requested");
    if (!report) return fail(report.error());
    return {{"status", "ok"},
            {"windows", report->windows},
            {"marked", report->owned},
            {"decodable", report->decodable},
            {"undecodable", report->undecodable},
            {"reconcile", to_json(report->reconcile)}};
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    const auto& stats = cursor_.stats();
    json resp = {
        {"status", "ok"},
        {"connection", to_string(supervisor_.state())},
        {"project", active_.name},
        {"reconnect_attempts", supervisor_.attempts()},
        {"reconnects", supervisor_.reconnects()},
        {"recoveries", recovery_.recoveries()},
        {"rules", classifier_.size()},
        {"journal", journal_.is_open()},
        {"cursor", {{"live", stats.live}, {"cached", stats.cached}, {"fallback", stats.fallback}}},
    };

    if (supervisor_.state() != ConnectionState::Connected) return resp;

    auto snapshot = wm_.snapshot();
    if (!snapshot) {
        resp["windows"] = nullptr;
        if (snapshot.error().retryable()) connection_lost(snapshot.error().message);
        return resp;
    }

    size_t scoped = 0;
    size_t global = 0;
    size_t hidden = 0;
    for (const auto& window : snapshot->windows) {
        if (classifier_.classify(window) == Scope::Scoped) scoped++;
        else global++;
        if (window.in_scratchpad()) hidden++;
    }
    resp["windows"] = {{"total", snapshot->windows.size()},
                       {"scoped", scoped},
                       {"global", global},
                       {"hidden", hidden}};
    return resp;
}

json DaemonCore::handle_dump(const json& /*cmd*/) {
    if (auto ok = supervisor_.require_connected(); !ok) return fail(ok.error());

    auto snapshot = wm_.snapshot();
    if (!snapshot) return fail(snapshot.error());

    json windows = json::array();
    for (const auto& window : snapshot->windows) {
        auto plan = reconciler_.plan(window, active_);
        windows.push_back({
            {"id", window.id},
            {"class", window.window_class},
            {"instance", window.instance},
            {"title", window.title},
            {"pid", window.pid},
            {"workspace", window.workspace_name},
            {"output", window.output},
            {"floating", window.floating},
            {"rect", {{"x", window.rect.x}, {"y", window.rect.y},
                      {"width", window.rect.width}, {"height", window.rect.height}}},
            {"marks", window.marks},
            {"scope", to_string(plan.scope)},
            {"owner", plan.owner ? json(*plan.owner) : json(nullptr)},
            {"state", plan.state ? to_json(*plan.state) : json(nullptr)},
            {"visible", plan.visible},
            {"desired_visible", plan.desired_visible},
            {"pending", to_string(plan.action)},
        });
    }

    size_t fallback = 0;
    json workspaces = json::array();
    for (const auto& g : reconciler_.workspace_geometries(*snapshot, fallback)) {
        workspaces.push_back({{"num", g.workspace_num}, {"output", g.monitor},
                              {"x", g.x_offset}, {"y", g.y_offset},
                              {"width", g.width}, {"height", g.height}});
    }

    return {{"status", "ok"},
            {"project", active_.name},
            {"connection", to_string(supervisor_.state())},
            {"workspaces", workspaces},
            {"active_workspace_index", fallback},
            {"windows", windows}};
}

json DaemonCore::handle_events(const json& cmd) {
    int limit = cmd.value("limit", 20);
    if (limit <= 0) limit = 20;

    json resp = {{"status", "ok"}, {"events", json::array()}};
    for (const auto& e : journal_.recent(limit)) {
        resp["events"].push_back({
            {"id", e.id},
            {"kind", to_string(e.kind)},
            {"timestamp", e.timestamp},
            {"detail", e.detail},
        });
    }
    return resp;
}

json DaemonCore::fail(const Error& error) {
    if (error.retryable() && supervisor_.state() == ConnectionState::Connected) {
        connection_lost(error.message);
    }
    return {{"status", "error"},
            {"kind", to_string(error.kind)},
            {"message", error.message},
            {"retryable", error.retryable()}};
}

void DaemonCore::apply_config(Config config) {
    config_ = std::move(config);

    codec_ = MarkCodec(config_.marks.prefix);
    classifier_ = WindowClassifier(config_.rules);
    cursor_.set_settings({config_.cursor.query_timeout(), config_.cursor.cache_ttl()});
    reconciler_.set_settings(reconcile_settings());
    supervisor_.set_config(BackoffConfig{std::chrono::milliseconds(config_.reconnect.base_ms),
                                         config_.reconnect.factor,
                                         std::chrono::milliseconds(config_.reconnect.cap_ms)});
    log(std::format("config applied: {} rules, gaps {}/{}/{}/{}", classifier_.size(), config_.gaps.top,
                    config_.gaps.bottom, config_.gaps.left, config_.gaps.right));

    // Rules may have changed what is scoped.
    if (supervisor_.state() == ConnectionState::Connected) {
        auto report = reconciler_.reconcile(active_);
        if (report.aborted) connection_lost(report.aborted->message);
    }
}

void DaemonCore::shutdown() {
    wm_.disconnect();
    journal_.close();
}

ReconcileSettings DaemonCore::reconcile_settings() const {
    return ReconcileSettings{
        .default_size = {config_.window.width, config_.window.height},
        .gaps = config_.gaps,
        .follow_cursor = config_.positioning.follow_cursor,
        .stagger = std::chrono::milliseconds(config_.reconcile.stagger_ms),
    };
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[i3pm] {}", msg);
    }
}

json to_json(const PersistedWindowState& s) {
    return {{"project", s.project}, {"floating", s.floating},
            {"x", s.x}, {"y", s.y}, {"width", s.width}, {"height", s.height},
            {"timestamp", s.timestamp}, {"workspace", s.workspace}, {"monitor", s.monitor}};
}

json to_json(const PositionResult& r) {
    json reasons = json::array();
    for (auto c : r.reasons) reasons.push_back(to_string(c));
    return {{"x", r.x}, {"y", r.y}, {"reasons", reasons}, {"quadrant", to_string(r.quadrant)},
            {"fits", r.fits}, {"monitor", r.monitor}, {"workspace", r.workspace_num}};
}

json to_json(const ReconcileReport& r) {
    return {{"examined", r.examined}, {"marked", r.marked}, {"hidden", r.hidden},
            {"shown", r.shown}, {"cleaned", r.cleaned}, {"failed", r.failed},
            {"commands", r.commands}, {"errors", r.errors}};
}
