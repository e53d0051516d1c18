#include <catch2/catch_test_macros.hpp>
#include "../src/events.hpp"

namespace {

Leg sample_leg() {
    Leg leg;
    leg.id = 4;
    leg.direction = Direction::Bear;
    leg.origin_price = 120.0;
    leg.origin_index = 3;
    leg.pivot_price = 100.0;
    leg.pivot_index = 5;
    return leg;
}

Bar sample_bar() {
    Bar bar;
    bar.index = 9;
    bar.timestamp_ms = 540000;
    return bar;
}

} // namespace

TEST_CASE("Event serialization", "[events]") {
    SECTION("Root leg has a null parent") {
        auto j = make_event(EventType::LegCreated, sample_leg(), sample_bar()).to_json();

        REQUIRE(j.at("type") == "LEG_CREATED");
        REQUIRE(j.at("bar_index") == 9);
        REQUIRE(j.at("timestamp") == 540000);
        REQUIRE(j.at("leg_id") == 4);
        REQUIRE(j.at("direction") == "bear");
        REQUIRE(j.at("parent_id").is_null());
        REQUIRE(j.at("children").is_array());
        REQUIRE(j.at("children").empty());
        REQUIRE(j.at("origin_price") == 120.0);
        REQUIRE(j.at("pivot_index") == 5);
        REQUIRE_FALSE(j.contains("reason"));
    }

    SECTION("Pruned event carries its reason and hierarchy") {
        Leg leg = sample_leg();
        leg.parent_id = 2;
        leg.children = {6, 7};
        DetectionEvent e = make_event(EventType::LegPruned, leg, sample_bar());
        e.reason = PruneReason::Engulfed;
        e.explanation = "breach 5.00 > 3.54";
        auto j = e.to_json();

        REQUIRE(j.at("type") == "LEG_PRUNED");
        REQUIRE(j.at("reason") == "engulfed");
        REQUIRE(j.at("parent_id") == 2);
        REQUIRE(j.at("children") == nlohmann::json::array({6, 7}));
        REQUIRE(j.at("explanation") == "breach 5.00 > 3.54");
    }

    SECTION("Reason names") {
        REQUIRE(to_string(PruneReason::TurnLimit) == "turn_limit");
        REQUIRE(to_string(PruneReason::Proximity) == "proximity");
        REQUIRE(to_string(PruneReason::InnerStructure) == "inner_structure");
        REQUIRE(to_string(EventType::LegStale) == "LEG_STALE");
    }
}
