#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <vector>

enum class RecoveryEventKind { Disconnect, Reconnect, StateRebuild };

// Diagnostics only. Nothing reads these back to make decisions.
struct RecoveryEvent {
    int64_t id = 0;
    RecoveryEventKind kind = RecoveryEventKind::StateRebuild;
    int64_t timestamp = 0;  // epoch seconds
    std::string detail;
};

class EventJournal {
public:
    EventJournal();
    ~EventJournal();

    EventJournal(const EventJournal&) = delete;
    EventJournal& operator=(const EventJournal&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool append(const RecoveryEvent& event);

    // Newest first.
    std::vector<RecoveryEvent> recent(int limit = 20);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};

const char* to_string(RecoveryEventKind kind);
std::optional<RecoveryEventKind> recovery_event_kind_from_string(std::string_view s);
