#include <catch2/catch_test_macros.hpp>

#include "position/positioning_engine.hpp"

#include <vector>

namespace {

WorkspaceGeometry workspace_1080p() {
    return WorkspaceGeometry{.width = 1920, .height = 1080, .x_offset = 0, .y_offset = 0,
                             .workspace_num = 1, .monitor = "HEADLESS-1", .gaps = {}};
}

CursorSample live(int x, int y) {
    return CursorSample{.x = x, .y = y, .source = CursorSource::Live, .valid = true, .timestamp = {}};
}

} // namespace

TEST_CASE("PositioningEngine", "[position]") {
    PositioningEngine engine;
    auto ws = workspace_1080p();

    SECTION("CursorInLowerRightClampsToBottomEdge") {
        auto r = engine.position(live(1500, 900), {800, 600}, ws);
        // tmpY = 600 exceeds breakY = 470; tmpX = 1100 is within breakX = 1110.
        REQUIRE(r.x == 1100);
        REQUIRE(r.y == 470);
        REQUIRE(r.fits);
        REQUIRE(r.quadrant == Quadrant::BottomRight);
        REQUIRE(r.has(Constraint::ConstrainedBottom));
        REQUIRE_FALSE(r.has(Constraint::ConstrainedRight));
        REQUIRE_FALSE(r.has(Constraint::Centered));
    }

    SECTION("MidpointBelongsToLowerRight") {
        auto r = engine.position(live(960, 540), {800, 600}, ws);
        REQUIRE(r.x == 560);
        REQUIRE(r.y == 240);
        REQUIRE(r.quadrant == Quadrant::BottomRight);
        REQUIRE(r.reasons == std::vector<Constraint>{Constraint::Centered});
        REQUIRE(r.fits);
    }

    SECTION("OneBelowMidpointIsUpperLeft") {
        auto r = engine.position(live(959, 539), {800, 600}, ws);
        REQUIRE(r.quadrant == Quadrant::TopLeft);
        REQUIRE(r.x == 559);
        REQUIRE(r.y == 239);
    }

    SECTION("OversizedWindowAnchorsAtTopGap") {
        for (auto [cx, cy] : {std::pair{0, 0}, std::pair{960, 540}, std::pair{1919, 1079}}) {
            auto r = engine.position(live(cx, cy), {1000, 1200}, ws);
            REQUIRE_FALSE(r.fits);
            REQUIRE(r.y == 10);
            REQUIRE(r.has(Constraint::OversizedFallback));
            // Width still fits, so x keeps the gaps.
            REQUIRE(r.x >= 10);
            REQUIRE(r.x <= 1920 - 10 - 1000);
        }
    }

    SECTION("TooTallForBothGapsCountsAsOversized") {
        // breakY = 1080 - 10 - 1065 = 5 is not negative, but it is above the top gap.
        auto r = engine.position(live(960, 900), {800, 1065}, ws);
        REQUIRE_FALSE(r.fits);
        REQUIRE(r.y == 10);
        REQUIRE(r.has(Constraint::OversizedFallback));

        auto just_fits = engine.position(live(960, 900), {800, 1060}, ws);
        REQUIRE(just_fits.fits);
        REQUIRE(just_fits.y == 10);
    }

    SECTION("OversizedOnBothAxes") {
        auto r = engine.position(live(960, 540), {2500, 1500}, ws);
        REQUIRE_FALSE(r.fits);
        REQUIRE(r.x == 10);
        REQUIRE(r.y == 10);
    }

    SECTION("UpperLeftClampsToTopAndLeftGaps") {
        auto r = engine.position(live(50, 40), {800, 600}, ws);
        REQUIRE(r.x == 10);
        REQUIRE(r.y == 10);
        REQUIRE(r.quadrant == Quadrant::TopLeft);
        REQUIRE(r.has(Constraint::ConstrainedTop));
        REQUIRE(r.has(Constraint::ConstrainedLeft));
    }

    SECTION("InvalidCursorUsesWorkspaceCenter") {
        CursorSample invalid{.x = 5000, .y = 5000, .source = CursorSource::FallbackCenter,
                             .valid = false, .timestamp = {}};
        auto r = engine.position(invalid, {800, 600}, ws);
        REQUIRE(r.x == 560);
        REQUIRE(r.y == 240);
        REQUIRE(r.quadrant == Quadrant::None);
        REQUIRE(r.has(Constraint::CursorInvalid));
        REQUIRE(r.fits);
    }

    SECTION("UnevenGapsStillKeepTheFarGap") {
        ws.gaps = GapConfig{.top = 10, .bottom = 10, .left = 10, .right = 300};
        // Left half, but centering would cross breakX = 1000 - 300 - 600 = 100.
        ws.width = 1000;
        auto r = engine.position(live(450, 300), {600, 400}, ws);
        REQUIRE(r.quadrant == Quadrant::TopLeft);
        REQUIRE(r.x == 100);
        REQUIRE(r.has(Constraint::ConstrainedRight));
    }

    SECTION("ClampingInvariantHoldsWheneverTheWindowFits") {
        ws.gaps = GapConfig{.top = 30, .bottom = 5, .left = 0, .right = 45};
        for (auto size : {WindowSize{800, 600}, WindowSize{1, 1}, WindowSize{1875, 1045},
                          WindowSize{300, 1000}}) {
            int break_x = ws.width - ws.gaps.right - size.width;
            int break_y = ws.height - ws.gaps.bottom - size.height;
            for (int cx = -100; cx <= 2100; cx += 37) {
                for (int cy = -100; cy <= 1200; cy += 41) {
                    auto r = engine.position(live(cx, cy), size, ws);
                    REQUIRE(r.fits);
                    REQUIRE(r.x >= ws.gaps.left);
                    REQUIRE(r.x <= break_x);
                    REQUIRE(r.y >= ws.gaps.top);
                    REQUIRE(r.y <= break_y);
                }
            }
        }
    }

    SECTION("MultiMonitorTranslatesIntoCursorMonitor") {
        std::vector<WorkspaceGeometry> spaces = {
            ws,
            WorkspaceGeometry{.width = 2560, .height = 1440, .x_offset = 1920, .y_offset = 0,
                              .workspace_num = 2, .monitor = "DP-2", .gaps = {}},
        };

        auto r = engine.position(live(1920 + 1280, 720), {800, 600}, spaces, 0);
        REQUIRE(r.monitor == "DP-2");
        REQUIRE(r.workspace_num == 2);
        REQUIRE(r.x == 1920 + 1280 - 400);
        REQUIRE(r.y == 720 - 300);

        auto corner = engine.position(live(1920 + 5, 5), {800, 600}, spaces, 0);
        REQUIRE(corner.x == 1920 + 10);
        REQUIRE(corner.y == 10);
    }

    SECTION("CursorOffEveryMonitorFallsBackToActiveWorkspace") {
        std::vector<WorkspaceGeometry> spaces = {
            ws,
            WorkspaceGeometry{.width = 1280, .height = 1024, .x_offset = 1920, .y_offset = 0,
                              .workspace_num = 5, .monitor = "DP-2", .gaps = {}},
        };
        auto r = engine.position(live(-500, -500), {800, 600}, spaces, 1);
        REQUIRE(r.monitor == "DP-2");
        REQUIRE(r.x == 1920 + 10);
        REQUIRE(r.y == 10);

        CursorSample invalid{};
        auto center = engine.position(invalid, {800, 600}, spaces, 1);
        REQUIRE(center.monitor == "DP-2");
        REQUIRE(center.x == 1920 + 640 - 400);
        REQUIRE(center.y == 512 - 300);
    }

    SECTION("RestoreKeepsSavedPositionInsideGaps") {
        PersistedWindowState saved{.project = "nixos", .floating = true, .x = 300, .y = 200,
                                   .width = 800, .height = 600, .timestamp = 0, .workspace = 1,
                                   .monitor = "HEADLESS-1", .window_id = 0};
        std::vector<WorkspaceGeometry> spaces = {ws};

        auto r = engine.restore(saved, spaces, 0);
        REQUIRE(r.x == 300);
        REQUIRE(r.y == 200);
        REQUIRE(r.reasons.empty());

        saved.x = 1500;
        saved.y = 900;
        auto clamped = engine.restore(saved, spaces, 0);
        REQUIRE(clamped.x == 1110);
        REQUIRE(clamped.y == 470);
        REQUIRE(clamped.has(Constraint::ConstrainedRight));
        REQUIRE(clamped.has(Constraint::ConstrainedBottom));
    }

    SECTION("WindowSizePrefersSavedState") {
        PersistedWindowState saved;
        saved.width = 1200;
        saved.height = 700;

        auto from_state = PositioningEngine::window_size(saved, {640, 480}, {1000, 600});
        REQUIRE(from_state.width == 1200);
        REQUIRE(from_state.height == 700);

        auto from_window = PositioningEngine::window_size(std::nullopt, {640, 480}, {1000, 600});
        REQUIRE(from_window.width == 640);

        auto fallback = PositioningEngine::window_size(std::nullopt, {0, 0}, {1000, 600});
        REQUIRE(fallback.width == 1000);
        REQUIRE(fallback.height == 600);
    }
}
