#include <catch2/catch_test_macros.hpp>
#include "../src/health.hpp"

TEST_CASE("Health monitor", "[health]") {
    HealthMonitor health;

    SECTION("Not ok until redis is up and the loop runs") {
        REQUIRE_FALSE(health.is_ok());
        health.set_redis(true);
        REQUIRE_FALSE(health.is_ok());
        health.set_loop_status("running");
        REQUIRE(health.is_ok());
        REQUIRE(health.to_json().at("ok") == true);
    }

    SECTION("Reports the last processed bar") {
        health.record_bar(41, 12, 3);
        auto j = health.to_json();
        REQUIRE(j.at("last_bar_index") == 41);
        REQUIRE(j.at("live_legs") == 12);
        REQUIRE(j.at("swings") == 3);
        REQUIRE(j.at("loop") == "starting");
    }

    SECTION("Redis loss clears the status") {
        health.set_redis(true);
        health.set_loop_status("running");
        health.set_redis(false);
        REQUIRE_FALSE(health.is_ok());
        REQUIRE(health.to_json().at("redis") == false);
    }
}
