#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include "../src/detector.hpp"
#include "../src/errors.hpp"
#include <cstdlib>

TEST_CASE("Detection config validation", "[config]") {
    DetectionConfig config;

    SECTION("Defaults are valid") {
        REQUIRE_NOTHROW(config.validate());
        REQUIRE(config.bull.formation_threshold == 0.382);
        REQUIRE(config.bear.engulfment_threshold == 0.236);
        REQUIRE(config.max_legs_per_turn == 3);
        REQUIRE_FALSE(config.enable_inner_structure_prune);
    }

    SECTION("Negative proximity tolerance") {
        config.proximity_tolerance = -0.1;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Zero formation threshold") {
        config.bear.formation_threshold = 0.0;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Zero lookback") {
        config.lookback = 0;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Detector refuses an invalid config") {
        config.max_legs_per_turn = 0;
        REQUIRE_THROWS_AS(Detector(config), ConfigError);
    }
}

TEST_CASE("Detection config from JSON", "[config]") {
    SECTION("Partial overlay keeps defaults elsewhere") {
        auto j = nlohmann::json::parse(R"({
            "bull": {"formation_threshold": 0.5},
            "lookback": 3,
            "enable_inner_structure_prune": true
        })");
        auto config = DetectionConfig::from_json(j);

        REQUIRE(config.bull.formation_threshold == 0.5);
        REQUIRE(config.bull.engulfment_threshold == 0.236);
        REQUIRE(config.bear.formation_threshold == 0.382);
        REQUIRE(config.lookback == 3);
        REQUIRE(config.enable_inner_structure_prune);
        REQUIRE(config.max_pair_distance == 500);
    }

    SECTION("Round trip through to_json") {
        DetectionConfig config;
        config.bear.child_swing_tolerance = 0.2;
        config.proximity_tolerance = 0.07;
        auto back = DetectionConfig::from_json(config.to_json());

        REQUIRE(back.bear.child_swing_tolerance == 0.2);
        REQUIRE(back.proximity_tolerance == 0.07);
    }

    SECTION("Non-object document") {
        REQUIRE_THROWS_AS(DetectionConfig::from_json(nlohmann::json::array()), ConfigError);
    }

    SECTION("Wrong value type") {
        auto j = nlohmann::json{{"lookback", "two"}};
        REQUIRE_THROWS_AS(DetectionConfig::from_json(j), ConfigError);
    }
}

TEST_CASE("Detection config from environment", "[config]") {
    SECTION("Valid overrides are applied") {
        setenv("SWING_LOOKBACK", "4", 1);
        setenv("SWING_BEAR_FORMATION_THRESHOLD", "0.5", 1);
        setenv("SWING_INNER_STRUCTURE_PRUNE", "true", 1);
        auto config = DetectionConfig::from_env();
        unsetenv("SWING_LOOKBACK");
        unsetenv("SWING_BEAR_FORMATION_THRESHOLD");
        unsetenv("SWING_INNER_STRUCTURE_PRUNE");

        REQUIRE(config.lookback == 4);
        REQUIRE(config.bear.formation_threshold == 0.5);
        REQUIRE(config.bull.formation_threshold == 0.382);
        REQUIRE(config.enable_inner_structure_prune);
    }

    SECTION("Unparseable values fall back to defaults") {
        setenv("SWING_LOOKBACK", "abc", 1);
        setenv("SWING_CHECK_INVARIANTS", "maybe", 1);
        auto config = DetectionConfig::from_env();
        unsetenv("SWING_LOOKBACK");
        unsetenv("SWING_CHECK_INVARIANTS");

        REQUIRE(config.lookback == 2);
        REQUIRE_FALSE(config.check_invariants);
    }

    SECTION("Boolean values ignore case and reject non-ASCII text") {
        setenv("SWING_INNER_STRUCTURE_PRUNE", "YES", 1);
        setenv("SWING_CHECK_INVARIANTS", "\xc3\xa9t\xc3\xa9", 1);
        auto config = DetectionConfig::from_env();
        unsetenv("SWING_INNER_STRUCTURE_PRUNE");
        unsetenv("SWING_CHECK_INVARIANTS");

        REQUIRE(config.enable_inner_structure_prune);
        REQUIRE_FALSE(config.check_invariants);
    }
}
