#include "recovery/recovery_manager.hpp"

#include <chrono>
#include <format>
#include <print>

RecoveryManager::RecoveryManager(WindowManager& wm, VisibilityReconciler& reconciler, CursorLocator& cursor,
                                 const MarkCodec& codec, EventJournal& journal, bool verbose, EpochClock now)
    : wm_(wm), reconciler_(reconciler), cursor_(cursor), codec_(codec), journal_(journal),
      verbose_(verbose), now_(std::move(now)) {
    if (!now_) {
        now_ = [] {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch()).count();
        };
    }
}

std::expected<RecoveryReport, Error> RecoveryManager::recover(const ProjectContext& active,
                                                              const std::string& reason) {
    // A pointer position from before the disconnect may belong to another session.
    cursor_.clear_cache();

    auto snapshot = wm_.snapshot();
    if (!snapshot) {
        log(std::format("recovery ({}) failed: {}", reason, snapshot.error().message));
        return std::unexpected(snapshot.error());
    }

    RecoveryReport report;
    report.windows = snapshot->windows.size();
    for (const auto& window : snapshot->windows) {
        auto mark = codec_.find_mark(window);
        if (!mark) continue;
        report.owned++;
        if (codec_.decode(*mark)) {
            report.decodable++;
        } else {
            report.undecodable++;
            log(std::format("window {}: undecodable mark '{}'", window.id, *mark));
        }
    }

    report.reconcile = reconciler_.reconcile(*snapshot, active);
    recoveries_++;

    auto detail = std::format("{}: {} windows, {} marked ({} without state), {} commands", reason,
                              report.windows, report.owned, report.undecodable, report.reconcile.commands);
    record(RecoveryEventKind::StateRebuild, detail);
    log("state rebuilt (" + detail + ")");

    if (report.reconcile.aborted) return std::unexpected(*report.reconcile.aborted);
    return report;
}

void RecoveryManager::record(RecoveryEventKind kind, const std::string& detail) {
    if (!journal_.is_open()) return;
    if (!journal_.append(RecoveryEvent{.id = 0, .kind = kind, .timestamp = now_(), .detail = detail})) {
        log(std::format("journal: could not record {} event", to_string(kind)));
    }
}

void RecoveryManager::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[i3pm] {}", msg);
    }
}
