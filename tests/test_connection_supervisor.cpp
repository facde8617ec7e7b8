#include <catch2/catch_test_macros.hpp>

#include "connection/connection_supervisor.hpp"

using namespace std::chrono_literals;

TEST_CASE("ConnectionSupervisor", "[connection]") {
    ConnectionSupervisor sup;

    SECTION("StartsDisconnected") {
        REQUIRE(sup.state() == ConnectionState::Disconnected);
        auto r = sup.require_connected();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().retryable());
    }

    SECTION("ExponentialBackoffIsCapped") {
        sup.on_connected();
        REQUIRE(sup.on_connection_lost() == 250ms);
        REQUIRE(sup.on_attempt_failed() == 500ms);
        REQUIRE(sup.on_attempt_failed() == 1000ms);
        REQUIRE(sup.on_attempt_failed() == 2000ms);
        REQUIRE(sup.on_attempt_failed() == 4000ms);
        REQUIRE(sup.on_attempt_failed() == 8000ms);
        REQUIRE(sup.on_attempt_failed() == 10000ms);
        REQUIRE(sup.on_attempt_failed() == 10000ms);
        REQUIRE(sup.attempts() == 7);
    }

    SECTION("CommandsFailRetryablyWhileReconnecting") {
        sup.on_connected();
        REQUIRE(sup.require_connected().has_value());

        sup.on_connection_lost();
        REQUIRE(sup.state() == ConnectionState::Reconnecting);
        auto r = sup.require_connected();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::TransientIo);
        REQUIRE(r.error().retryable());
    }

    SECTION("SuccessfulReconnectResetsBackoff") {
        sup.on_connected();
        REQUIRE(sup.reconnects() == 0);

        sup.on_connection_lost();
        sup.on_attempt_failed();
        sup.on_attempt_failed();
        sup.on_connected();
        REQUIRE(sup.state() == ConnectionState::Connected);
        REQUIRE(sup.reconnects() == 1);
        REQUIRE(sup.attempts() == 0);

        REQUIRE(sup.on_connection_lost() == 250ms);
    }

    SECTION("CustomConfig") {
        BackoffConfig cfg{.base = 100ms, .factor = 3.0, .cap = 1000ms};
        REQUIRE(cfg.valid());
        sup.set_config(cfg);
        REQUIRE(sup.delay_for(0) == 100ms);
        REQUIRE(sup.delay_for(1) == 300ms);
        REQUIRE(sup.delay_for(2) == 900ms);
        REQUIRE(sup.delay_for(3) == 1000ms);

        REQUIRE_FALSE(BackoffConfig{.base = 500ms, .factor = 2.0, .cap = 100ms}.valid());
        REQUIRE_FALSE(BackoffConfig{.base = 100ms, .factor = 0.5, .cap = 1000ms}.valid());
    }
}
