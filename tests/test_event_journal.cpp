#include <catch2/catch_test_macros.hpp>

#include "storage/event_journal.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("i3pm_test_journal_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

} // namespace

TEST_CASE("EventJournal", "[journal]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        EventJournal journal;
        REQUIRE(journal.open(tmp.path));
        REQUIRE(journal.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("AppendAndRetrieve") {
        TmpDb tmp;
        EventJournal journal;
        REQUIRE(journal.open(tmp.path));

        REQUIRE(journal.append({.kind = RecoveryEventKind::Disconnect, .timestamp = 1730934000,
                                .detail = "shutdown event (restart)"}));

        auto events = journal.recent(1);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].id > 0);
        REQUIRE(events[0].kind == RecoveryEventKind::Disconnect);
        REQUIRE(events[0].timestamp == 1730934000);
        REQUIRE(events[0].detail == "shutdown event (restart)");
    }

    SECTION("NewestFirstAndLimit") {
        TmpDb tmp;
        EventJournal journal;
        REQUIRE(journal.open(tmp.path));

        REQUIRE(journal.append({.kind = RecoveryEventKind::Disconnect, .timestamp = 1, .detail = "a"}));
        REQUIRE(journal.append({.kind = RecoveryEventKind::Reconnect, .timestamp = 2, .detail = "b"}));
        REQUIRE(journal.append({.kind = RecoveryEventKind::StateRebuild, .timestamp = 3, .detail = "c"}));

        auto events = journal.recent(2);
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].kind == RecoveryEventKind::StateRebuild);
        REQUIRE(events[1].kind == RecoveryEventKind::Reconnect);
    }

    SECTION("PersistsAcrossReopen") {
        TmpDb tmp;
        {
            EventJournal journal;
            REQUIRE(journal.open(tmp.path));
            REQUIRE(journal.append({.kind = RecoveryEventKind::Reconnect, .timestamp = 9, .detail = "x"}));
        }
        EventJournal journal;
        REQUIRE(journal.open(tmp.path));
        REQUIRE(journal.recent().size() == 1);
    }

    SECTION("ClosedJournalRejectsWrites") {
        EventJournal journal;
        REQUIRE_FALSE(journal.is_open());
        REQUIRE_FALSE(journal.append({}));
        REQUIRE(journal.recent().empty());
    }

    SECTION("KindNames") {
        REQUIRE(std::string(to_string(RecoveryEventKind::StateRebuild)) == "state-rebuild");
        REQUIRE(recovery_event_kind_from_string("disconnect") == RecoveryEventKind::Disconnect);
        REQUIRE_FALSE(recovery_event_kind_from_string("explode").has_value());
    }
}
