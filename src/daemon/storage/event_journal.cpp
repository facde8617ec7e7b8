#include "event_journal.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

EventJournal::EventJournal() = default;

EventJournal::~EventJournal() {
    close();
}

bool EventJournal::open(const std::string& path) {
    close();

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "journal: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO recovery_events (kind, timestamp, detail) VALUES (?, ?, ?)";

    const char* recent_sql =
        "SELECT id, kind, timestamp, detail FROM recovery_events ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "journal: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "journal: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void EventJournal::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool EventJournal::append(const RecoveryEvent& event) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, to_string(event.kind), -1, SQLITE_STATIC);
    sqlite3_bind_int64(insert_stmt_, 2, event.timestamp);
    if (event.detail.empty()) sqlite3_bind_null(insert_stmt_, 3);
    else sqlite3_bind_text(insert_stmt_, 3, event.detail.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "journal: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<RecoveryEvent> EventJournal::recent(int limit) {
    std::vector<RecoveryEvent> events;
    if (!recent_stmt_) return events;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        auto kind = recovery_event_kind_from_string(get_text(recent_stmt_, 1));
        if (!kind) continue;

        RecoveryEvent e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.kind = *kind;
        e.timestamp = sqlite3_column_int64(recent_stmt_, 2);
        e.detail = get_text(recent_stmt_, 3);
        events.push_back(std::move(e));
    }

    return events;
}

bool EventJournal::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS recovery_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            kind TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            detail TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "journal: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

const char* to_string(RecoveryEventKind kind) {
    switch (kind) {
        case RecoveryEventKind::Disconnect: return "disconnect";
        case RecoveryEventKind::Reconnect: return "reconnect";
        case RecoveryEventKind::StateRebuild: return "state-rebuild";
    }
    return "unknown";
}

std::optional<RecoveryEventKind> recovery_event_kind_from_string(std::string_view s) {
    if (s == "disconnect") return RecoveryEventKind::Disconnect;
    if (s == "reconnect") return RecoveryEventKind::Reconnect;
    if (s == "state-rebuild") return RecoveryEventKind::StateRebuild;
    return std::nullopt;
}
