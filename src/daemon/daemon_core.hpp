#pragma once

#include "classify/window_classifier.hpp"
#include "config.hpp"
#include "connection/connection_supervisor.hpp"
#include "cursor/cursor_locator.hpp"
#include "errors.hpp"
#include "platform/cursor_query.hpp"
#include "platform/process_detector.hpp"
#include "platform/window_manager.hpp"
#include "project_context.hpp"
#include "reconcile/visibility_reconciler.hpp"
#include "recovery/recovery_manager.hpp"
#include "state/mark_codec.hpp"
#include "storage/event_journal.hpp"
#include "sway/wm_event.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

// Portable daemon logic. The platform event loop feeds it window-manager
// events, command-socket requests and reconnect timer expiries, all on one
// thread, and arms its reconnect timer through ScheduleReconnect.
class DaemonCore {
public:
    using ScheduleReconnect = std::function<void(std::chrono::milliseconds)>;

    struct Paths {
        std::string active_project;  // active-project.json
        std::string journal;         // events.db

        static Paths defaults();
    };

    DaemonCore(Config config, bool verbose, Paths paths,
               WindowManager& wm, CursorQuery& cursor_query, ProcessDetector& detector,
               ScheduleReconnect schedule);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Journal and active project. Never fails: both degrade to defaults.
    void init();

    // Initial handshake, then recovery. An error here is fatal to the process.
    std::expected<void, Error> start();

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // The window-manager event socket is readable.
    void on_wm_readable();

    // The reconnect timer fired.
    void on_reconnect_timer();

    // Config reload (SIGHUP). Sections were already validated by Config::load.
    void apply_config(Config config);

    const Config& config() const { return config_; }
    const ProjectContext& active_project() const { return active_; }
    ConnectionState connection_state() const { return supervisor_.state(); }

    void shutdown();

private:
    // One typed handler per event kind.
    void handle_event(const WmEvent& event);
    void on_window_event(const WmEvent& event);
    void on_workspace_event(const WmEvent& event);
    void on_output_event(const WmEvent& event);
    void on_shutdown_event(const WmEvent& event);

    void connection_lost(const std::string& reason);
    std::expected<void, Error> handshake();
    void run_recovery(const std::string& reason);

    nlohmann::json handle_switch(const nlohmann::json& cmd);
    nlohmann::json handle_reconcile(const nlohmann::json& cmd);
    nlohmann::json handle_classify(const nlohmann::json& cmd);
    nlohmann::json handle_position(const nlohmann::json& cmd);
    nlohmann::json handle_save_state(const nlohmann::json& cmd);
    nlohmann::json handle_restore_state(const nlohmann::json& cmd);
    nlohmann::json handle_recover(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_dump(const nlohmann::json& cmd);
    nlohmann::json handle_events(const nlohmann::json& cmd);

    // Error response; a retryable failure while connected also starts a reconnect.
    nlohmann::json fail(const Error& error);

    ReconcileSettings reconcile_settings() const;
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    Paths paths_;

    WindowManager& wm_;
    ProcessDetector& detector_;
    ScheduleReconnect schedule_;

    ProjectContext active_;
    MarkCodec codec_;
    WindowClassifier classifier_;
    CursorLocator cursor_;
    VisibilityReconciler reconciler_;
    EventJournal journal_;
    RecoveryManager recovery_;
    ConnectionSupervisor supervisor_;
};

nlohmann::json to_json(const PersistedWindowState& state);
nlohmann::json to_json(const PositionResult& result);
nlohmann::json to_json(const ReconcileReport& report);
