#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "state/mark_codec.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "i3pm_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (fd >= 0) {
            auto written = ::write(fd, content.data(), content.size());
            (void)written;
            ::close(fd);
        }
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Clears the gap overrides for the duration of a test.
struct GapEnv {
    GapEnv() { clear(); }
    ~GapEnv() { clear(); }
    static void clear() {
        for (const char* v : {"I3RUN_TOP_GAP", "I3RUN_BOTTOM_GAP", "I3RUN_LEFT_GAP", "I3RUN_RIGHT_GAP"}) {
            ::unsetenv(v);
        }
    }
};

} // namespace

TEST_CASE("Config", "[config]") {
    GapEnv env;

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.gaps == GapConfig{10, 10, 10, 10});
        REQUIRE(cfg.window.width == 1000);
        REQUIRE(cfg.window.height == 600);
        REQUIRE(cfg.cursor.query_timeout_ms == 150);
        REQUIRE(cfg.cursor.cache_ttl_ms == 2000);
        REQUIRE(cfg.cursor.command.front() == "xdotool");
        REQUIRE(cfg.reconnect.base_ms == 250);
        REQUIRE(cfg.reconnect.cap_ms == 10000);
        REQUIRE(cfg.marks.prefix == "scratch");
        REQUIRE(cfg.positioning.follow_cursor);
        REQUIRE(cfg.reconcile.stagger_ms == 0);
        REQUIRE(cfg.rules.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "gaps": { "top": 40, "bottom": 20, "left": 5, "right": 5 },
            "window": { "width": 1200, "height": 800 },
            "cursor": { "query_timeout_ms": 100, "cache_ttl_ms": 500,
                        "command": ["swaymsg-cursor", "--shell"] },
            "reconnect": { "base_ms": 100, "factor": 1.5, "cap_ms": 5000, "command_timeout_ms": 750 },
            "marks": { "prefix": "i3pm" },
            "positioning": { "follow_cursor": false },
            "reconcile": { "stagger_ms": 25 },
            "rules": [
                { "pattern": "^firefox$", "scope": "global", "priority": 100, "source": "system" },
                { "pattern": "code", "type": "class" },
                { "pattern": "nixos", "type": "title", "priority": 70 }
            ]
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.gaps == GapConfig{40, 20, 5, 5});
        REQUIRE(cfg.window.width == 1200);
        REQUIRE(cfg.cursor.query_timeout_ms == 100);
        REQUIRE(cfg.cursor.cache_ttl_ms == 500);
        REQUIRE(cfg.cursor.command == std::vector<std::string>{"swaymsg-cursor", "--shell"});
        REQUIRE(cfg.reconnect.factor == 1.5);
        REQUIRE(cfg.reconnect.command_timeout_ms == 750);
        REQUIRE(cfg.marks.prefix == "i3pm");
        REQUIRE_FALSE(cfg.positioning.follow_cursor);
        REQUIRE(cfg.reconcile.stagger_ms == 25);

        REQUIRE(cfg.rules.size() == 3);
        REQUIRE(cfg.rules[0].scope == Scope::Global);
        REQUIRE(cfg.rules[0].source == RuleSource::System);
        REQUIRE(cfg.rules[1].scope == Scope::Scoped);
        REQUIRE(cfg.rules[1].priority == 50);
        REQUIRE(cfg.rules[1].source == RuleSource::User);
        REQUIRE(cfg.rules[2].type == PatternType::Title);
    }

    SECTION("PartialConfigKeepsDefaults") {
        TmpFile f(R"({ "gaps": { "top": 30 } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.gaps.top == 30);
        REQUIRE(cfg.gaps.bottom == 10);
        REQUIRE(cfg.window.width == 1000);
    }

    SECTION("InvalidSectionKeepsPreviousValue") {
        Config previous;
        previous.gaps = GapConfig{1, 2, 3, 4};
        previous.window.width = 900;

        TmpFile f(R"({
            "gaps": { "top": 40, "bottom": -5 },
            "window": { "width": 0 },
            "reconcile": { "stagger_ms": 10 }
        })");
        auto cfg = Config::load(f.path, previous);
        REQUIRE(cfg.gaps == GapConfig{1, 2, 3, 4});
        REQUIRE(cfg.window.width == 900);
        REQUIRE(cfg.reconcile.stagger_ms == 10);
    }

    SECTION("OutOfRangeAndMistypedValues") {
        TmpFile f(R"({
            "gaps": { "left": 501 },
            "cursor": { "query_timeout_ms": "fast" },
            "reconnect": { "base_ms": 5000, "cap_ms": 1000 },
            "marks": { "prefix": "bad:prefix" },
            "positioning": { "follow_cursor": "yes" }
        })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.gaps.left == 10);
        REQUIRE(cfg.cursor.query_timeout_ms == 150);
        REQUIRE(cfg.reconnect.base_ms == 250);
        REQUIRE(cfg.reconnect.cap_ms == 10000);
        REQUIRE(cfg.marks.prefix == "scratch");
        REQUIRE(cfg.positioning.follow_cursor);
    }

    SECTION("OverlongPrefixAndStaggerRejected") {
        TmpFile f(R"({
            "marks": { "prefix": ")" + std::string(MAX_MARK_PREFIX_LENGTH + 1, 'p') + R"(" },
            "reconcile": { "stagger_ms": 200 }
        })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.marks.prefix == "scratch");
        REQUIRE(cfg.reconcile.stagger_ms == 0);

        TmpFile ok(R"({ "marks": { "prefix": ")" + std::string(MAX_MARK_PREFIX_LENGTH, 'p') + R"(" } })");
        REQUIRE(Config::load(ok.path).marks.prefix.size() == MAX_MARK_PREFIX_LENGTH);
    }

    SECTION("BadRulesAreDroppedIndividually") {
        TmpFile f(R"({
            "rules": [
                { "pattern": "fire(fox" },
                { "pattern": "kitty", "priority": 150 },
                { "pattern": "kitty", "scope": "sometimes" },
                { "type": "class" },
                { "pattern": "alacritty" }
            ]
        })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.rules.size() == 1);
        REQUIRE(cfg.rules[0].pattern == "alacritty");
    }

    SECTION("ParseErrorKeepsPrevious") {
        Config previous;
        previous.window.height = 700;
        TmpFile f("{ this is not json");
        auto cfg = Config::load(f.path, previous);
        REQUIRE(cfg.window.height == 700);
    }

    SECTION("MissingFileKeepsPrevious") {
        Config previous;
        previous.marks.prefix = "proj";
        auto cfg = Config::load("/nonexistent/i3pm/config.json", previous);
        REQUIRE(cfg.marks.prefix == "proj");
    }

    SECTION("GapEnvironmentOverrides") {
        ::setenv("I3RUN_TOP_GAP", "48", 1);
        ::setenv("I3RUN_RIGHT_GAP", "0", 1);
        TmpFile f(R"({ "gaps": { "top": 20, "bottom": 20, "left": 20, "right": 20 } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.gaps == GapConfig{48, 20, 20, 0});
    }

    SECTION("InvalidGapOverridesAreIgnoredTogether") {
        ::setenv("I3RUN_TOP_GAP", "48", 1);
        ::setenv("I3RUN_BOTTOM_GAP", "lots", 1);
        auto gaps = apply_gap_env_overrides(GapConfig{1, 2, 3, 4});
        REQUIRE(gaps == GapConfig{1, 2, 3, 4});

        ::setenv("I3RUN_BOTTOM_GAP", "900", 1);
        REQUIRE(apply_gap_env_overrides(GapConfig{1, 2, 3, 4}) == GapConfig{1, 2, 3, 4});
    }
}
